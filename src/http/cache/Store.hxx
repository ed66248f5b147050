// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * The contract between the cache core and a storage backend.
 */

#pragma once

#include "Types.hxx"

#include <concepts>
#include <optional>
#include <vector>

/**
 * A cache storage backend.
 *
 * - `S::Ref` is an opaque reference to one stored response; it is
 *   only valid for this backend instance and may become stale at any
 *   time.
 *
 * - `S::Options` is passed through from the caller to the backend
 *   without inspection (deadlines, cancellation).
 *
 * - ListCandidates() returns all responses stored under the key,
 *   including stale and expired ones; an unknown key yields an empty
 *   vector.
 *
 * - GetResponse() returns std::nullopt if the response was evicted or
 *   invalidated since ListCandidates().
 *
 * - Put(), NotifyUsed() and InvalidateUrl() throw
 *   #HttpCacheStoreError on failure.
 */
template<typename S>
concept HttpCacheStore =
	std::copyable<typename S::Ref> &&
	requires(S &store,
		 const typename S::Ref &ref,
		 const typename S::Options &options,
		 const HttpCacheRequestKey &key,
		 const HttpCacheUrlDigest &url_digest,
		 const HttpCacheVary &vary,
		 const HttpCacheResponse &response,
		 const HttpCacheMetadata &metadata) {
		{ store.ListCandidates(key, options) } -> std::same_as<std::vector<HttpCacheCandidate<typename S::Ref>>>;
		{ store.GetResponse(ref, options) } -> std::same_as<std::optional<HttpCacheStoredResponse>>;
		store.Put(key, url_digest, vary, response, metadata, options);
		store.NotifyUsed(ref, options);
		{ store.InvalidateUrl(url_digest, options) } -> std::same_as<HttpCacheInvalidationResult>;
	};

/**
 * A backend which can also invalidate all responses tagged with one
 * of the given alternate keys.
 */
template<typename S>
concept HttpCacheAlternateKeyStore =
	HttpCacheStore<S> &&
	requires(S &store,
		 const std::vector<HttpCacheAlternateKey> &keys,
		 const typename S::Options &options) {
		{ store.InvalidateByAlternateKey(keys, options) } -> std::same_as<HttpCacheInvalidationResult>;
	};

template<typename S>
inline constexpr bool HttpCacheSupportsAlternateKeys = HttpCacheAlternateKeyStore<S>;
