// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "util/StringParser.hxx"

#include <stdexcept>

using std::string_view_literals::operator""sv;

/**
 * Parse a number of seconds; at most one year.
 */
static std::chrono::seconds
ParseSeconds(const char *s)
{
	return std::chrono::seconds{ParsePositiveLong(s, 365L * 24 * 3600)};
}

void
HttpCacheStoreConfig::HandleSet(std::string_view name, const char *value)
{
	if (name == "max_size"sv) {
		max_size = ParseSize(value);
		if (max_size == 0)
			throw std::invalid_argument("Must be positive");
	} else if (name == "tie_break"sv) {
		selector.tie_break = ParseHttpCacheTieBreak(value);
	} else if (name == "allow_stale"sv) {
		selector.allow_stale = ParseBool(value);
	} else if (name == "default_ttl"sv) {
		evaluate.default_ttl = ParseSeconds(value);
	} else if (name == "max_heuristic_ttl"sv) {
		evaluate.max_heuristic_ttl = ParseSeconds(value);
	} else if (name == "grace"sv) {
		evaluate.grace = std::chrono::seconds{ParseUnsignedLong(value)};
	} else if (name == "alternate_keys_header"sv) {
		evaluate.alternate_keys_header = value;
	} else
		throw std::runtime_error("Unknown variable");
}

void
HttpCacheStoreConfig::Check() const
{
	if (store == StoreType::DISK && path.empty())
		throw std::runtime_error("The disk store requires a 'path'");
}

const char *
ToString(HttpCacheStoreConfig::StoreType type) noexcept
{
	switch (type) {
	case HttpCacheStoreConfig::StoreType::HEAP:
		return "heap";

	case HttpCacheStoreConfig::StoreType::DISK:
		return "disk";
	}

	return "?";
}
