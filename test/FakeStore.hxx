// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/cache/Error.hxx"
#include "http/cache/Store.hxx"

#include <string>
#include <vector>

struct FakeStoreOptions {
	int tag = 0;
};

/**
 * A scripted cache store for unit tests.  Responses can be made to
 * vanish between ListCandidates() and GetResponse(), and all calls
 * are recorded.
 */
class FakeStore {
public:
	using Ref = unsigned;

	using Options = FakeStoreOptions;

	struct Entry {
		HttpCacheRequestKey key;
		HttpCacheUrlDigest url_digest;
		HttpCacheCandidateInfo info;
		std::string body;

		/**
		 * Still listed, but GetResponse() fails to find it.
		 */
		bool vanished = false;

		/**
		 * Neither listed nor found.
		 */
		bool removed = false;
	};

	std::vector<Entry> entries;

	std::vector<Ref> get_calls, used;
	std::vector<int> option_tags;

	bool fail_get = false, fail_put = false;

	Ref Add(const HttpCacheRequestKey &key, const HttpCacheVary &vary,
		const HttpCacheMetadata &metadata,
		std::string body={},
		HttpCacheUrlDigest url_digest="url") {
		Entry e;
		e.key = key;
		e.url_digest = std::move(url_digest);
		e.info.vary = vary;
		e.info.metadata = metadata;
		e.info.status = metadata.IsPartial()
			? HttpStatus::PARTIAL_CONTENT
			: HttpStatus::OK;
		e.body = std::move(body);
		entries.emplace_back(std::move(e));
		return entries.size() - 1;
	}

	void Vanish(Ref ref) noexcept {
		entries[ref].vanished = true;
	}

	std::vector<HttpCacheCandidate<Ref>>
	ListCandidates(const HttpCacheRequestKey &key,
		       const Options &options={}) {
		option_tags.push_back(options.tag);

		std::vector<HttpCacheCandidate<Ref>> result;
		for (Ref i = 0; i < entries.size(); ++i) {
			const auto &e = entries[i];
			if (e.key != key || e.removed)
				continue;

			HttpCacheCandidate<Ref> c;
			static_cast<HttpCacheCandidateInfo &>(c) = e.info;
			c.ref = i;
			result.emplace_back(std::move(c));
		}

		return result;
	}

	std::optional<HttpCacheStoredResponse>
	GetResponse(const Ref &ref, const Options &options={}) {
		option_tags.push_back(options.tag);
		get_calls.push_back(ref);

		if (fail_get)
			throw HttpCacheStoreError{"get failed"};

		const auto &e = entries.at(ref);
		if (e.vanished || e.removed)
			return std::nullopt;

		return HttpCacheStoredResponse{
			e.info.status, e.info.response_headers,
			e.body, e.info.metadata,
		};
	}

	void Put(const HttpCacheRequestKey &key,
		 const HttpCacheUrlDigest &url_digest,
		 const HttpCacheVary &vary,
		 const HttpCacheResponse &response,
		 const HttpCacheMetadata &metadata,
		 const Options &options={}) {
		option_tags.push_back(options.tag);

		if (fail_put)
			throw HttpCacheStoreError{"put failed"};

		const auto *body = std::get_if<std::string>(&response.body);
		Add(key, vary, metadata, body != nullptr ? *body : std::string{},
		    url_digest);
		entries.back().info.status = response.status;
		entries.back().info.response_headers = response.headers;
	}

	void NotifyUsed(const Ref &ref, const Options &options={}) {
		option_tags.push_back(options.tag);
		used.push_back(ref);
	}

	HttpCacheInvalidationResult
	InvalidateUrl(const HttpCacheUrlDigest &url_digest,
		      const Options &options={}) {
		option_tags.push_back(options.tag);

		std::size_t n = 0;
		for (auto &e : entries) {
			if (e.url_digest == url_digest && !e.removed) {
				e.removed = true;
				++n;
			}
		}

		return {n};
	}
};

/**
 * A #FakeStore which also supports alternate keys, but cannot count
 * invalidated responses.
 */
class FakeAlternateKeyStore : public FakeStore {
public:
	std::vector<std::vector<HttpCacheAlternateKey>> alternate_key_calls;

	HttpCacheInvalidationResult
	InvalidateByAlternateKey(const std::vector<HttpCacheAlternateKey> &keys,
				 const Options &options={}) {
		option_tags.push_back(options.tag);
		alternate_key_calls.push_back(keys);

		for (auto &e : entries)
			for (const auto &key : keys)
				if (e.info.metadata.alternate_keys.contains(key))
					e.removed = true;

		return {std::nullopt};
	}
};
