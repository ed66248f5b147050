// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Command-line tool for inspecting and maintaining a cache store.
 */

#include "Config.hxx"
#include "ConfigParser.hxx"
#include "http/Date.hxx"
#include "http/cache/DiskStore.hxx"
#include "http/cache/Freshness.hxx"
#include "http/cache/HeapStore.hxx"
#include "http/cache/Invalidator.hxx"
#include "http/cache/Key.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <fmt/format.h>

#include <span>
#include <stdexcept>
#include <vector>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static void
Usage()
{
	fmt::print(stderr,
		   "Usage: cache-store-tool [-v] CONFIG COMMAND [ARGS]\n"
		   "\n"
		   "Commands:\n"
		   "  list KEY\n"
		   "  invalidate-url DIGEST\n"
		   "  invalidate-keys KEY...\n"
		   "  reap\n"
		   "  key METHOD URL [BUCKET]\n"
		   "  digest URL\n");
}

static void
PrintCandidate(const auto &c, HttpCacheTime now)
{
	const auto &m = c.metadata;

	fmt::print("#{} status={} {} created={} expires={} grace={} ttl_set_by={}\n",
		   c.ref, unsigned(c.status),
		   ToString(HttpCacheClassify(m, now)),
		   http_date_format(m.created),
		   http_date_format(m.expires),
		   http_date_format(m.grace),
		   ToString(m.ttl_set_by));

	for (const auto &[name, value] : c.vary) {
		if (value)
			fmt::print("  vary {}: {:?}\n", name, *value);
		else
			fmt::print("  vary {}: (absent)\n", name);
	}

	if (const auto *range = m.GetContentRange())
		fmt::print("  content-range: {}\n", range->Format());

	for (const auto &i : m.alternate_keys)
		fmt::print("  alternate-key: {}\n", i);
}

static void
PrintInvalidationOutcome(const HttpCacheInvalidationOutcome &outcome)
{
	if (!outcome.IsSupported())
		fmt::print("unsupported\n");
	else if (outcome.count)
		fmt::print("{}\n", *outcome.count);
	else
		fmt::print("unknown\n");
}

static std::size_t
Reap(HttpCacheDiskStore &store, HttpCacheTime now)
{
	return store.Reap(now);
}

static std::size_t
Reap(HttpCacheHeapStore &store, HttpCacheTime now)
{
	return store.Expire(now);
}

template<HttpCacheStore S>
static int
RunStoreCommand(S &store, const char *command, std::span<const char *const> args)
{
	const auto now = HttpCacheNow();

	if (strcmp(command, "list") == 0) {
		if (args.size() != 1)
			throw std::runtime_error("Usage: list KEY");

		for (const auto &c : store.ListCandidates(args.front()))
			PrintCandidate(c, now);
	} else if (strcmp(command, "invalidate-url") == 0) {
		if (args.size() != 1)
			throw std::runtime_error("Usage: invalidate-url DIGEST");

		HttpCacheInvalidator<S> invalidator(store);
		PrintInvalidationOutcome(invalidator.InvalidateUrl(args.front()));
	} else if (strcmp(command, "invalidate-keys") == 0) {
		if (args.empty())
			throw std::runtime_error("Usage: invalidate-keys KEY...");

		HttpCacheInvalidator<S> invalidator(store);
		const std::vector<HttpCacheAlternateKey> keys(args.begin(), args.end());
		const auto outcome = invalidator.InvalidateByAlternateKey(keys);
		PrintInvalidationOutcome(outcome);
		if (!outcome.IsSupported())
			return EXIT_FAILURE;
	} else if (strcmp(command, "reap") == 0) {
		if (!args.empty())
			throw std::runtime_error("Usage: reap");

		fmt::print("{}\n", Reap(store, now));
	} else
		throw std::runtime_error(fmt::format("Unknown command: {}", command));

	return EXIT_SUCCESS;
}

/**
 * Commands which do not need a store.
 *
 * @return true if the command was handled
 */
static bool
RunKeyCommand(const char *command, std::span<const char *const> args)
{
	if (strcmp(command, "key") == 0) {
		if (args.size() != 2 && args.size() != 3)
			throw std::runtime_error("Usage: key METHOD URL [BUCKET]");

		std::optional<std::string_view> bucket;
		if (args.size() == 3)
			bucket = args[2];

		fmt::print("{}\n", HttpCacheMakeRequestKey(args[0], args[1], {}, bucket));
		return true;
	} else if (strcmp(command, "digest") == 0) {
		if (args.size() != 1)
			throw std::runtime_error("Usage: digest URL");

		fmt::print("{}\n", HttpCacheMakeUrlDigest(args.front()));
		return true;
	} else
		return false;
}

int
main(int argc, char **argv)
try {
	const char *const *const argv_c = argv;
	std::span<const char *const> args{argv_c + 1, std::size_t(argc - 1)};

	unsigned verbose = 1;
	while (!args.empty() && strcmp(args.front(), "-v") == 0) {
		++verbose;
		args = args.subspan(1);
	}

	SetLogLevel(verbose);

	if (args.size() < 2) {
		Usage();
		return EXIT_FAILURE;
	}

	const char *const config_path = args[0];
	const char *const command = args[1];
	args = args.subspan(2);

	if (RunKeyCommand(command, args))
		return EXIT_SUCCESS;

	HttpCacheStoreConfig config;
	LoadConfigFile(config, config_path);

	switch (config.store) {
	case HttpCacheStoreConfig::StoreType::HEAP:
		{
			/* a fresh heap store is empty; this is only
			   useful for testing the configuration */
			HttpCacheHeapStore store(config.max_size);
			return RunStoreCommand(store, command, args);
		}

	case HttpCacheStoreConfig::StoreType::DISK:
		{
			HttpCacheDiskStore store(config.path);
			return RunStoreCommand(store, command, args);
		}
	}

	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
