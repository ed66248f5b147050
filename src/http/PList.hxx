// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parsing comma-separated HTTP header lists (RFC 7230 7).
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * Split a comma-separated list into its items, stripping whitespace
 * and skipping empty items.  Items are converted to lower case.
 */
std::vector<std::string>
http_list_split(std::string_view p);

/**
 * Like http_list_split(), but preserve the case of the items.
 */
std::vector<std::string>
http_list_split_verbatim(std::string_view p);
