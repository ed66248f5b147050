// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * The backend-independent part of the candidate selection.
 */

#pragma once

#include "Freshness.hxx"
#include "Range.hxx"
#include "Types.hxx"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

/**
 * How to order the remaining candidates.
 */
enum class HttpCacheTieBreak : uint8_t {
	/**
	 * Newest "created" first, then larger "expires".
	 */
	CREATED,

	/**
	 * Larger "expires" first, then newest "created".
	 */
	EXPIRES,
};

[[gnu::const]]
const char *
ToString(HttpCacheTieBreak tie_break) noexcept;

/**
 * Throws std::invalid_argument on error.
 */
HttpCacheTieBreak
ParseHttpCacheTieBreak(std::string_view s);

struct HttpCacheSelectorConfig {
	HttpCacheTieBreak tie_break = HttpCacheTieBreak::CREATED;

	/**
	 * May stale responses (within the grace period) be
	 * selected?
	 */
	bool allow_stale = true;
};

/**
 * Does the stored response satisfy the requested range?  A full
 * response satisfies everything; a partial response must cover the
 * range.  Without a range request, only full responses are
 * eligible.
 */
[[gnu::pure]]
bool
HttpCacheRangeFits(const HttpCacheMetadata &metadata,
		   const std::optional<HttpRangeRequest> &range) noexcept;

struct HttpCacheRankedCandidate {
	/**
	 * Index into the array passed to HttpCacheRankCandidates().
	 */
	std::size_t index;

	HttpCacheFreshness freshness;
};

/**
 * Filter the candidates (vary, range, freshness) and order the
 * remaining ones, best first.  Candidates which compare equal keep
 * their listing order.
 */
std::vector<HttpCacheRankedCandidate>
HttpCacheRankCandidates(std::span<const HttpCacheCandidateInfo *const> candidates,
			const HttpCacheVary &request_vary,
			const std::optional<HttpRangeRequest> &range,
			HttpCacheTime now,
			const HttpCacheSelectorConfig &config);
