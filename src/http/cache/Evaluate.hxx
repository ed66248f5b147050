// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Caching rules (RFC 7234): which requests and responses may be
 * cached, and for how long.
 */

#pragma once

#include "Metadata.hxx"
#include "Types.hxx"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

struct HttpCacheEvaluateConfig {
	/**
	 * The time to live of responses which have neither explicit
	 * expiry headers nor a "Last-Modified" header.
	 */
	std::chrono::seconds default_ttl = std::chrono::minutes{5};

	/**
	 * The upper limit for the time to live guessed from
	 * "Last-Modified".
	 */
	std::chrono::seconds max_heuristic_ttl = std::chrono::hours{24};

	/**
	 * How long may a response be served after it has expired?
	 */
	std::chrono::seconds grace = std::chrono::minutes{2};

	/**
	 * The response header which lists the alternate keys
	 * (comma-separated).
	 */
	std::string alternate_keys_header = "x-cache-alternate-keys";
};

/**
 * Check whether the request could produce a cacheable response.
 */
[[gnu::pure]]
bool
HttpCacheRequestEvaluate(std::string_view method,
			 const HttpCacheHeaders &headers,
			 bool has_request_body) noexcept;

/**
 * Does a request with this method invalidate the cached responses of
 * its URL (RFC 7234 4.4)?
 */
[[gnu::pure]]
bool
HttpCacheRequestInvalidate(std::string_view method) noexcept;

/**
 * Decide whether a response may be stored and calculate its
 * metadata.
 *
 * @param now the time the response was received; becomes
 * #HttpCacheMetadata::created
 * @return the metadata or std::nullopt if the response must not be
 * cached
 */
std::optional<HttpCacheMetadata>
HttpCacheEvaluateResponse(HttpStatus status, const HttpCacheHeaders &headers,
			  HttpCacheTime now,
			  const HttpCacheEvaluateConfig &config);
