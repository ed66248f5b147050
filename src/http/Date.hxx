// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/**
 * Parse an HTTP date (RFC 7231 7.1.1.1: IMF-fixdate, RFC 850 or
 * asctime format).
 *
 * @return the time stamp or std::nullopt if the string is malformed
 */
[[gnu::pure]]
std::optional<std::chrono::sys_seconds>
http_date_parse(std::string_view s) noexcept;

/**
 * Format a time stamp as IMF-fixdate.
 */
std::string
http_date_format(std::chrono::sys_seconds t);
