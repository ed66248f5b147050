// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Select.hxx"
#include "Store.hxx"
#include "io/Logger.hxx"

#include <optional>
#include <vector>

template<typename Ref>
struct HttpCacheSelection {
	Ref ref;
	HttpCacheStoredResponse response;
	HttpCacheFreshness freshness;
};

/**
 * Resolves a request to the one stored response which matches its
 * "Vary" headers and its range.
 */
template<HttpCacheStore S>
class HttpCacheSelector {
	S &store;

	const HttpCacheSelectorConfig config;

	const Logger logger{"HttpCacheSelector"};

public:
	using Ref = typename S::Ref;
	using Options = typename S::Options;

	explicit HttpCacheSelector(S &_store,
				   const HttpCacheSelectorConfig &_config={}) noexcept
		:store(_store), config(_config) {}

	const HttpCacheSelectorConfig &GetConfig() const noexcept {
		return config;
	}

	/**
	 * Find the best stored response.  A response which disappears
	 * between listing and fetching is skipped silently; backend
	 * failures are propagated.
	 *
	 * @param request_vary the request's values of the "Vary"
	 * headers; a missing name means "absent"
	 * @param range the requested range (or std::nullopt)
	 * @return the response or std::nullopt on cache miss
	 */
	std::optional<HttpCacheSelection<Ref>>
	Resolve(const HttpCacheRequestKey &key,
		const HttpCacheVary &request_vary,
		const std::optional<HttpRangeRequest> &range,
		HttpCacheTime now,
		const Options &options={}) const {
		auto candidates = store.ListCandidates(key, options);
		if (candidates.empty()) {
			logger(5, "miss");
			return std::nullopt;
		}

		std::vector<const HttpCacheCandidateInfo *> infos;
		infos.reserve(candidates.size());
		for (const auto &i : candidates)
			infos.push_back(&i);

		for (const auto &i : HttpCacheRankCandidates(infos, request_vary,
							     range, now, config)) {
			auto &candidate = candidates[i.index];

			auto response = store.GetResponse(candidate.ref, options);
			if (!response) {
				logger(4, "candidate vanished, trying next");
				continue;
			}

			logger(5, "hit (", ToString(i.freshness), ")");
			return HttpCacheSelection<Ref>{
				std::move(candidate.ref),
				std::move(*response),
				i.freshness,
			};
		}

		logger(5, "no matching candidate");
		return std::nullopt;
	}
};
