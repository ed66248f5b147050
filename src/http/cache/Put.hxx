// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Error.hxx"
#include "Store.hxx"

/**
 * Store a response after validating its metadata.  Throws
 * #HttpCacheInvalidMetadata without touching the backend if the
 * metadata is malformed or if a "206 Partial Content" response has
 * no content range; backend errors are propagated.
 */
template<HttpCacheStore S>
void
HttpCachePut(S &store, const HttpCacheRequestKey &key,
	     const HttpCacheUrlDigest &url_digest,
	     const HttpCacheVary &vary,
	     const HttpCacheResponse &response,
	     const HttpCacheMetadata &metadata,
	     const typename S::Options &options={})
{
	metadata.Validate();

	if (response.status == HttpStatus::PARTIAL_CONTENT &&
	    !metadata.IsPartial())
		throw HttpCacheInvalidMetadata{"Partial response without content-range"};

	store.Put(key, url_digest, vary, response, metadata, options);
}
