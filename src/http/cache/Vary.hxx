// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Content negotiation: matching the "Vary" request headers recorded
 * with a stored response against a new request (RFC 7234 4.1).
 */

#pragma once

#include "Types.hxx"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * Does the request match the "Vary" headers recorded with a stored
 * response?  Only the headers named by the stored response are
 * compared.  A name missing from #request counts as "absent", and
 * "absent" only matches "absent".
 */
[[gnu::pure]]
bool
HttpCacheVaryFits(const HttpCacheVary &stored,
		  const HttpCacheVary &request) noexcept;

/**
 * Record the request headers named by a response's "Vary" header.
 *
 * @param vary the value of the "Vary" response header (may be empty)
 * @return the recorded values, or std::nullopt if the response
 * cannot be cached ("Vary: *")
 */
std::optional<HttpCacheVary>
HttpCacheCopyVary(std::string_view vary,
		  const HttpCacheHeaders &request_headers);

/**
 * Build the request side of a vary comparison: the (normalized)
 * values of the given request headers.
 *
 * @param names lower-case header names, e.g. collected from the
 * candidates' #HttpCacheVary maps
 */
HttpCacheVary
HttpCacheRequestVary(const std::vector<std::string> &names,
		     const HttpCacheHeaders &request_headers);
