// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Select.hxx"
#include "Vary.hxx"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

using std::string_view_literals::operator""sv;

const char *
ToString(HttpCacheTieBreak tie_break) noexcept
{
	switch (tie_break) {
	case HttpCacheTieBreak::CREATED:
		return "created";

	case HttpCacheTieBreak::EXPIRES:
		return "expires";
	}

	return "?";
}

HttpCacheTieBreak
ParseHttpCacheTieBreak(std::string_view s)
{
	if (s == "created"sv)
		return HttpCacheTieBreak::CREATED;
	else if (s == "expires"sv)
		return HttpCacheTieBreak::EXPIRES;
	else
		throw std::invalid_argument{fmt::format("Unknown tie-break policy: {:?}", s)};
}

bool
HttpCacheRangeFits(const HttpCacheMetadata &metadata,
		   const std::optional<HttpRangeRequest> &range) noexcept
{
	const auto *content_range = metadata.GetContentRange();
	if (content_range == nullptr)
		/* a full response satisfies any range */
		return true;

	return range && content_range->Covers(*range);
}

[[gnu::pure]]
static bool
IsBetter(const HttpCacheMetadata &a, const HttpCacheMetadata &b,
	 HttpCacheTieBreak tie_break) noexcept
{
	switch (tie_break) {
	case HttpCacheTieBreak::CREATED:
		if (a.created != b.created)
			return a.created > b.created;
		return a.expires > b.expires;

	case HttpCacheTieBreak::EXPIRES:
		if (a.expires != b.expires)
			return a.expires > b.expires;
		return a.created > b.created;
	}

	return false;
}

std::vector<HttpCacheRankedCandidate>
HttpCacheRankCandidates(std::span<const HttpCacheCandidateInfo *const> candidates,
			const HttpCacheVary &request_vary,
			const std::optional<HttpRangeRequest> &range,
			HttpCacheTime now,
			const HttpCacheSelectorConfig &config)
{
	std::vector<std::size_t> matching;
	matching.reserve(candidates.size());

	bool have_full = false;
	for (std::size_t i = 0; i < candidates.size(); ++i) {
		const auto &c = *candidates[i];
		if (!HttpCacheVaryFits(c.vary, request_vary))
			continue;

		matching.push_back(i);
		if (!c.metadata.IsPartial())
			have_full = true;
	}

	std::vector<HttpCacheRankedCandidate> result;
	result.reserve(matching.size());

	for (const std::size_t i : matching) {
		const auto &metadata = candidates[i]->metadata;

		if (range) {
			if (!HttpCacheRangeFits(metadata, range))
				continue;
		} else if (have_full && metadata.IsPartial())
			/* without a range request, partial responses
			   are only a fallback */
			continue;

		const auto freshness = HttpCacheClassify(metadata, now);
		if (freshness == HttpCacheFreshness::EXPIRED ||
		    (freshness == HttpCacheFreshness::STALE && !config.allow_stale))
			continue;

		result.push_back({i, freshness});
	}

	std::stable_sort(result.begin(), result.end(),
			 [candidates, tie_break=config.tie_break](const auto &a, const auto &b){
				 return IsBetter(candidates[a.index]->metadata,
						 candidates[b.index]->metadata,
						 tie_break);
			 });

	return result;
}
