// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Types.hxx"

#include <string_view>

/**
 * Look up a header by its name (case-insensitive).  If the header
 * occurs more than once, the first one is returned.
 *
 * @return the value or nullptr if there is no such header
 */
[[gnu::pure]]
const std::string *
HttpCacheGetHeader(const HttpCacheHeaders &headers,
		   std::string_view name) noexcept;

/**
 * Like HttpCacheGetHeader(), but treat an empty value like a
 * missing header.
 */
[[gnu::pure]]
const std::string *
HttpCacheGetNonEmptyHeader(const HttpCacheHeaders &headers,
			   std::string_view name) noexcept;
