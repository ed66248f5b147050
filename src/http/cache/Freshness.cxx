// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Freshness.hxx"

const char *
ToString(HttpCacheFreshness freshness) noexcept
{
	switch (freshness) {
	case HttpCacheFreshness::FRESH:
		return "fresh";

	case HttpCacheFreshness::STALE:
		return "stale";

	case HttpCacheFreshness::EXPIRED:
		return "expired";
	}

	return "?";
}

std::chrono::seconds
HttpCacheTimeToLive(const HttpCacheMetadata &metadata,
		    HttpCacheTime now) noexcept
{
	if (now >= metadata.expires)
		return std::chrono::seconds::zero();

	return metadata.expires - now;
}
