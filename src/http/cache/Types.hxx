// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * The vocabulary shared by the cache core and its backends.
 */

#pragma once

#include "Metadata.hxx"
#include "http/Status.hxx"
#include "io/SharedFd.hxx"

#include <boost/filesystem/path.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * Identifies method, URL, body and bucket of a request; does not
 * include the "Vary" request headers or the range.  Opaque to the
 * cache core.
 */
using HttpCacheRequestKey = std::string;

/**
 * Identifies the URL alone; used to invalidate all responses of a
 * URL.  Opaque to the cache core.
 */
using HttpCacheUrlDigest = std::string;

/**
 * An application-defined tag for bulk invalidation.
 */
using HttpCacheAlternateKey = std::string;

/**
 * A list of HTTP headers in wire order.  Lookups are
 * case-insensitive (see Headers.hxx).
 */
using HttpCacheHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * Maps a (lower-case) header name to its value at storage time.
 * std::nullopt means "the request did not have this header", which
 * is different from an empty value.
 */
using HttpCacheVary = std::map<std::string, std::optional<std::string>, std::less<>>;

/**
 * A response body which is stored in a file.
 */
struct HttpCacheFileBody {
	boost::filesystem::path path;
	uint64_t size;

	/**
	 * If set, the file was opened by the backend, and this
	 * descriptor stays valid even after the backend has deleted
	 * the file.  Readers should prefer it over #path.
	 */
	std::shared_ptr<const SharedFd> fd;

	bool operator==(const HttpCacheFileBody &) const noexcept = default;
};

/**
 * The response body: either in memory or in a file.
 */
using HttpCacheBody = std::variant<std::string, HttpCacheFileBody>;

/**
 * Load the whole body into memory.
 *
 * Throws on I/O error or if the file is shorter than expected.
 */
std::string
HttpCacheReadBody(const HttpCacheBody &body);

/**
 * A response as passed to HttpCacheStore::Put().
 */
struct HttpCacheResponse {
	HttpStatus status = HttpStatus::OK;
	HttpCacheHeaders headers;
	HttpCacheBody body;
};

/**
 * A response as returned by HttpCacheStore::GetResponse().
 */
struct HttpCacheStoredResponse {
	HttpStatus status = HttpStatus::OK;
	HttpCacheHeaders headers;
	HttpCacheBody body;
	HttpCacheMetadata metadata;

	[[gnu::pure]]
	uint64_t GetBodySize() const noexcept;
};

/**
 * The backend-independent part of a #HttpCacheCandidate.
 */
struct HttpCacheCandidateInfo {
	HttpStatus status = HttpStatus::OK;
	HttpCacheHeaders response_headers;
	HttpCacheVary vary;
	HttpCacheMetadata metadata;
};

/**
 * A stored response without its body; enough to decide whether it
 * matches a request.
 *
 * @param Ref the backend's opaque response reference
 */
template<typename Ref>
struct HttpCacheCandidate : HttpCacheCandidateInfo {
	Ref ref;
};

struct HttpCacheInvalidationResult {
	/**
	 * The number of responses which were invalidated;
	 * std::nullopt if the backend cannot tell.
	 */
	std::optional<std::size_t> count;
};
