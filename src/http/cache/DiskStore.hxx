// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "DiskRecord.hxx"
#include "Types.hxx"
#include "io/Logger.hxx"

#include <boost/filesystem/path.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

/**
 * A persistent cache store.  Each response is stored in a directory
 * as a record file (see include/http-cache-store/DiskRecord.hxx) and
 * a body file.  An in-memory index of all records is built by the
 * constructor.
 *
 * Invalidation removes a response from the index and deletes its
 * record file immediately; the body file is deleted later by Reap().
 * Readers get an open descriptor of the body, so a response returned
 * by GetResponse() remains complete even if it is deleted afterwards.
 * This backend does not support alternate keys.
 *
 * All methods are thread-safe.
 */
class HttpCacheDiskStore {
public:
	using Ref = uint64_t;

	struct Options {};

private:
	const Logger logger{"HttpCacheDiskStore"};

	const boost::filesystem::path directory;

	mutable std::mutex mutex;

	Ref next_id = 1;

	std::map<Ref, HttpCacheDiskRecord> records;

	std::multimap<std::string, Ref, std::less<>> by_key, by_url;

	/**
	 * Records which have been removed from the index, but whose
	 * files have not yet been deleted.
	 */
	std::vector<Ref> doomed;

public:
	/**
	 * Open (or create) the store directory and load the index.
	 * Corrupt records are skipped and scheduled for deletion.
	 *
	 * Throws #HttpCacheStoreError on error.
	 */
	explicit HttpCacheDiskStore(const boost::filesystem::path &_directory);

	HttpCacheDiskStore(const HttpCacheDiskStore &) = delete;
	HttpCacheDiskStore &operator=(const HttpCacheDiskStore &) = delete;

	const boost::filesystem::path &GetDirectory() const noexcept {
		return directory;
	}

	std::size_t GetCount() const noexcept;

	std::vector<HttpCacheCandidate<Ref>>
	ListCandidates(const HttpCacheRequestKey &key,
		       const Options &options={}) const;

	/**
	 * The body is returned as a #HttpCacheFileBody with an open
	 * file descriptor.
	 *
	 * Throws #HttpCacheStoreError if the body cannot be opened.
	 */
	std::optional<HttpCacheStoredResponse>
	GetResponse(const Ref &ref, const Options &options={}) const;

	/**
	 * Throws #HttpCacheStoreError on error.
	 */
	void Put(const HttpCacheRequestKey &key,
		 const HttpCacheUrlDigest &url_digest,
		 const HttpCacheVary &vary,
		 const HttpCacheResponse &response,
		 const HttpCacheMetadata &metadata,
		 const Options &options={});

	/**
	 * Ignored: this store has no size limit and evicts nothing.
	 */
	void NotifyUsed(const Ref &ref, const Options &options={}) noexcept;

	/**
	 * The number of invalidated responses is not reported.
	 *
	 * Throws #HttpCacheStoreError if a record file cannot be
	 * deleted; the responses have been removed from the index
	 * nonetheless.
	 */
	HttpCacheInvalidationResult
	InvalidateUrl(const HttpCacheUrlDigest &url_digest,
		      const Options &options={});

	/**
	 * Drop all responses whose grace period has ended from the
	 * index, and delete the files of all dropped and invalidated
	 * responses.  Errors are logged.
	 *
	 * @return the number of responses whose files were deleted
	 */
	std::size_t Reap(HttpCacheTime now);

private:
	boost::filesystem::path GetRecordPath(Ref id) const;
	boost::filesystem::path GetBodyPath(Ref id) const;

	void Load();

	/**
	 * Remove a record from the index (but not from the disk).
	 * Caller must hold the mutex.
	 */
	void Forget(Ref id) noexcept;

	/**
	 * Delete the files of a record.  Errors are logged.
	 */
	void Unlink(Ref id) noexcept;
};
