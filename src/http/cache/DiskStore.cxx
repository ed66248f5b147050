// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "DiskStore.hxx"
#include "Error.hxx"
#include "serialize.hxx"
#include "system/Error.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <set>

#include <errno.h>
#include <stdlib.h>
#include <string.h>

namespace fs = boost::filesystem;

using std::string_view_literals::operator""sv;

static constexpr auto RECORD_SUFFIX = ".record"sv;
static constexpr auto BODY_SUFFIX = ".body"sv;
static constexpr auto TMP_SUFFIX = ".tmp"sv;

/**
 * Parse the 16 hex digits of a file name stem.
 */
static std::optional<uint64_t>
ParseRecordId(const std::string &stem) noexcept
{
	if (stem.size() != 16)
		return std::nullopt;

	char *endptr;
	const uint64_t id = strtoull(stem.c_str(), &endptr, 16);
	if (endptr != stem.c_str() + stem.size() || id == 0)
		return std::nullopt;

	return id;
}

static std::string
ReadFile(const fs::path &path)
{
	fs::ifstream f{path, std::ios::binary};
	if (!f)
		throw FmtErrno("Failed to open {}", path.string());

	std::string result{std::istreambuf_iterator<char>{f},
			   std::istreambuf_iterator<char>{}};
	if (f.bad())
		throw FmtErrno("Failed to read {}", path.string());

	return result;
}

/**
 * Write the file under a temporary name and rename it, so readers
 * never see a partial file.
 */
static void
WriteFileAtomic(const fs::path &path, std::string_view contents)
{
	fs::path tmp = path;
	tmp += std::string{TMP_SUFFIX};

	{
		fs::ofstream f{tmp, std::ios::binary|std::ios::trunc};
		if (!f)
			throw FmtErrno("Failed to create {}", tmp.string());

		f.write(contents.data(), contents.size());
		f.close();
		if (!f)
			throw FmtErrno("Failed to write {}", tmp.string());
	}

	fs::rename(tmp, path);
}

/**
 * Copy the file under a temporary name and rename it.
 *
 * @return the size of the file
 */
static uint64_t
CopyFileAtomic(const fs::path &src, const fs::path &path)
{
	fs::path tmp = path;
	tmp += std::string{TMP_SUFFIX};

	fs::copy_file(src, tmp, fs::copy_options::overwrite_existing);
	const uint64_t size = fs::file_size(tmp);
	fs::rename(tmp, path);
	return size;
}

HttpCacheDiskStore::HttpCacheDiskStore(const fs::path &_directory)
	:directory(_directory)
{
	try {
		fs::create_directories(directory);
		Load();
	} catch (...) {
		std::throw_with_nested(HttpCacheStoreError{
				fmt::format("Failed to open cache directory {}",
					    directory.string())});
	}
}

fs::path
HttpCacheDiskStore::GetRecordPath(Ref id) const
{
	return directory / fmt::format("{:016x}{}", id, RECORD_SUFFIX);
}

fs::path
HttpCacheDiskStore::GetBodyPath(Ref id) const
{
	return directory / fmt::format("{:016x}{}", id, BODY_SUFFIX);
}

void
HttpCacheDiskStore::Load()
{
	std::set<Ref> bodies;
	std::vector<fs::path> stale;

	for (const auto &entry : fs::directory_iterator{directory}) {
		const auto &path = entry.path();
		if (!fs::is_regular_file(entry.status()))
			continue;

		const auto extension = path.extension().string();
		if (extension == TMP_SUFFIX) {
			/* left over from an interrupted Put() */
			stale.push_back(path);
			continue;
		}

		const auto id = ParseRecordId(path.stem().string());
		if (!id)
			continue;

		if (*id >= next_id)
			next_id = *id + 1;

		if (extension == BODY_SUFFIX) {
			bodies.insert(*id);
			continue;
		}

		if (extension != RECORD_SUFFIX)
			continue;

		try {
			auto record = DeserializeDiskRecord(ReadFile(path));
			by_key.emplace(record.key, *id);
			by_url.emplace(record.url_digest, *id);
			records.emplace(*id, std::move(record));
		} catch (const DeserializeError &) {
			logger(2, "Corrupt cache record: ", path.string());
			doomed.push_back(*id);
		} catch (const std::system_error &) {
			logger(2, "Failed to load cache record: ",
			       std::current_exception());
		}
	}

	for (const auto &path : stale) {
		boost::system::error_code ec;
		fs::remove(path, ec);
	}

	/* delete bodies without a record */
	for (const Ref id : bodies)
		if (!records.contains(id) &&
		    std::find(doomed.begin(), doomed.end(), id) == doomed.end())
			doomed.push_back(id);

	logger(4, "loaded ", records.size(), " records from ",
	       directory.string());
}

std::size_t
HttpCacheDiskStore::GetCount() const noexcept
{
	const std::scoped_lock lock{mutex};
	return records.size();
}

std::vector<HttpCacheCandidate<HttpCacheDiskStore::Ref>>
HttpCacheDiskStore::ListCandidates(const HttpCacheRequestKey &key,
				   const Options &) const
{
	std::vector<HttpCacheCandidate<Ref>> result;

	const std::scoped_lock lock{mutex};

	auto [begin, end] = by_key.equal_range(key);
	for (auto i = begin; i != end; ++i) {
		const auto &record = records.at(i->second);

		HttpCacheCandidate<Ref> c;
		c.ref = i->second;
		c.status = record.status;
		c.response_headers = record.headers;
		c.vary = record.vary;
		c.metadata = record.metadata;
		result.emplace_back(std::move(c));
	}

	return result;
}

std::optional<HttpCacheStoredResponse>
HttpCacheDiskStore::GetResponse(const Ref &ref, const Options &) const
{
	const std::scoped_lock lock{mutex};

	auto i = records.find(ref);
	if (i == records.end())
		return std::nullopt;

	const auto &record = i->second;
	const auto body_path = GetBodyPath(ref);

	/* open the body while the record is still indexed; Reap()
	   cannot delete it before we have a descriptor */
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(body_path.c_str())) {
		const int e = errno;
		if (e == ENOENT) {
			logger(2, "Body file is missing: ", body_path.string());
			return std::nullopt;
		}

		throw HttpCacheStoreError{
			fmt::format("Failed to open {}: {}",
				    body_path.string(), strerror(e))};
	}

	return HttpCacheStoredResponse{
		record.status,
		record.headers,
		HttpCacheFileBody{
			body_path, record.body_size,
			std::make_shared<const SharedFd>(std::move(fd)),
		},
		record.metadata,
	};
}

void
HttpCacheDiskStore::Put(const HttpCacheRequestKey &key,
			const HttpCacheUrlDigest &url_digest,
			const HttpCacheVary &vary,
			const HttpCacheResponse &response,
			const HttpCacheMetadata &metadata,
			const Options &)
{
	Ref id;

	{
		const std::scoped_lock lock{mutex};
		id = next_id++;
	}

	HttpCacheDiskRecord record{
		key, url_digest, response.status, response.headers,
		vary, metadata, 0,
	};

	const auto record_path = GetRecordPath(id);
	const auto body_path = GetBodyPath(id);

	try {
		if (const auto *s = std::get_if<std::string>(&response.body)) {
			WriteFileAtomic(body_path, *s);
			record.body_size = s->size();
		} else if (const auto &file = std::get<HttpCacheFileBody>(response.body);
			   file.fd) {
			/* the path may be gone already */
			const auto body = HttpCacheReadBody(response.body);
			WriteFileAtomic(body_path, body);
			record.body_size = body.size();
		} else
			record.body_size = CopyFileAtomic(file.path, body_path);

		/* the record is written last; its presence commits
		   the response */
		WriteFileAtomic(record_path, SerializeDiskRecord(record));
	} catch (...) {
		boost::system::error_code ec;
		fs::remove(body_path, ec);

		std::throw_with_nested(HttpCacheStoreError{
				fmt::format("Failed to store response in {}",
					    directory.string())});
	}

	const std::scoped_lock lock{mutex};
	by_key.emplace(key, id);
	by_url.emplace(url_digest, id);
	records.emplace(id, std::move(record));
}

void
HttpCacheDiskStore::NotifyUsed(const Ref &, const Options &) noexcept
{
	/* there is no size limit and thus no eviction order */
}

HttpCacheInvalidationResult
HttpCacheDiskStore::InvalidateUrl(const HttpCacheUrlDigest &url_digest,
				  const Options &)
{
	const std::scoped_lock lock{mutex};

	std::vector<Ref> ids;
	auto [begin, end] = by_url.equal_range(url_digest);
	for (auto i = begin; i != end; ++i)
		ids.push_back(i->second);

	for (const Ref id : ids) {
		Forget(id);
		doomed.push_back(id);
	}

	/* delete the record files now, so Load() does not resurrect
	   them; the bodies are orphans until Reap() (or the next
	   Load()) deletes them */
	std::size_t n_failed = 0;
	for (const Ref id : ids) {
		boost::system::error_code ec;
		fs::remove(GetRecordPath(id), ec);
		if (ec) {
			logger(2, "Failed to delete ", GetRecordPath(id).string(),
			       ": ", ec.message());
			++n_failed;
		}
	}

	if (n_failed > 0)
		throw HttpCacheStoreError{
			fmt::format("Failed to delete {} of {} records in {}",
				    n_failed, ids.size(), directory.string())};

	logger(4, "invalidated ", ids.size(), " records");

	/* other processes may share the directory with records this
	   index has never seen; we do not promise a count */
	return {std::nullopt};
}

std::size_t
HttpCacheDiskStore::Reap(HttpCacheTime now)
{
	std::vector<Ref> ids;

	{
		const std::scoped_lock lock{mutex};

		std::vector<Ref> expired;
		for (const auto &[id, record] : records)
			if (now >= record.metadata.grace)
				expired.push_back(id);

		for (const Ref id : expired) {
			Forget(id);
			doomed.push_back(id);
		}

		ids.swap(doomed);
	}

	for (const Ref id : ids)
		Unlink(id);

	if (!ids.empty())
		logger(4, "reaped ", ids.size(), " records");

	return ids.size();
}

template<typename I>
static void
EraseIndex(I &index, std::string_view key, uint64_t value) noexcept
{
	auto [begin, end] = index.equal_range(key);
	for (auto i = begin; i != end; ++i) {
		if (i->second == value) {
			index.erase(i);
			return;
		}
	}
}

void
HttpCacheDiskStore::Forget(Ref id) noexcept
{
	auto i = records.find(id);
	if (i == records.end())
		return;

	EraseIndex(by_key, i->second.key, id);
	EraseIndex(by_url, i->second.url_digest, id);
	records.erase(i);
}

void
HttpCacheDiskStore::Unlink(Ref id) noexcept
{
	/* the record goes first: without it, the body is an orphan
	   which the next Load() deletes */
	for (const auto &path : {GetRecordPath(id), GetBodyPath(id)}) {
		boost::system::error_code ec;
		fs::remove(path, ec);
		if (ec)
			logger(2, "Failed to delete ", path.string(), ": ",
			       ec.message());
	}
}
