// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Metadata.hxx"

#include <chrono>
#include <cstdint>

enum class HttpCacheFreshness : uint8_t {
	/**
	 * now < expires
	 */
	FRESH,

	/**
	 * expires <= now < grace: may be served, but should be
	 * revalidated.
	 */
	STALE,

	/**
	 * now >= grace: must not be served.
	 */
	EXPIRED,
};

[[gnu::const]]
const char *
ToString(HttpCacheFreshness freshness) noexcept;

constexpr HttpCacheFreshness
HttpCacheClassify(const HttpCacheMetadata &metadata, HttpCacheTime now) noexcept
{
	if (now < metadata.expires)
		return HttpCacheFreshness::FRESH;

	if (now < metadata.grace)
		return HttpCacheFreshness::STALE;

	return HttpCacheFreshness::EXPIRED;
}

/**
 * How long will this response remain fresh?  Returns zero if it is
 * already stale or expired.
 */
[[gnu::pure]]
std::chrono::seconds
HttpCacheTimeToLive(const HttpCacheMetadata &metadata,
		    HttpCacheTime now) noexcept;
