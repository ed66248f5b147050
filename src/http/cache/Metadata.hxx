// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Range.hxx"

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>

/**
 * All cache time stamps have whole-second resolution.
 */
using HttpCacheTime = std::chrono::sys_seconds;

static inline HttpCacheTime
HttpCacheNow() noexcept
{
	return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

/**
 * Where did the expiry time come from?  This is informational only;
 * it does not affect freshness.
 */
enum class HttpCacheTtlSource : uint8_t {
	/**
	 * An explicit "Cache-Control" or "Expires" response header.
	 */
	HEADER,

	/**
	 * Guessed from "Last-Modified" or from the configured
	 * default.
	 */
	HEURISTIC,
};

[[gnu::const]]
const char *
ToString(HttpCacheTtlSource source) noexcept;

/**
 * A response header value which was parsed at storage time.
 */
using HttpCacheParsedValue = std::variant<std::string, int64_t, HttpContentRange>;

struct HttpCacheMetadata {
	HttpCacheTime created{}, expires{}, grace{};

	HttpCacheTtlSource ttl_set_by = HttpCacheTtlSource::HEURISTIC;

	/**
	 * Parsed response headers; the key is the lower-case header
	 * name.  A partial response has a "content-range" entry
	 * holding a #HttpContentRange.
	 */
	std::map<std::string, HttpCacheParsedValue, std::less<>> parsed_headers;

	/**
	 * Application-defined tags for bulk invalidation.
	 */
	std::set<std::string, std::less<>> alternate_keys;

	/**
	 * @return the stored range of a partial response or nullptr if
	 * this is a full response
	 */
	[[gnu::pure]]
	const HttpContentRange *GetContentRange() const noexcept;

	bool IsPartial() const noexcept {
		return GetContentRange() != nullptr;
	}

	void SetContentRange(const HttpContentRange &range) {
		parsed_headers.insert_or_assign("content-range", range);
	}

	/**
	 * Check the invariants: `created <= expires <= grace`, and a
	 * "content-range" entry must hold a #HttpContentRange.
	 *
	 * Throws #HttpCacheInvalidMetadata on error.
	 */
	void Validate() const;

	bool operator==(const HttpCacheMetadata &) const noexcept = default;
};
