// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

enum class HttpStatus : uint_least16_t {
	UNDEFINED = 0,

	OK = 200,
	NON_AUTHORITATIVE_INFORMATION = 203,
	NO_CONTENT = 204,
	PARTIAL_CONTENT = 206,

	MULTIPLE_CHOICES = 300,
	MOVED_PERMANENTLY = 301,
	FOUND = 302,
	NOT_MODIFIED = 304,
	PERMANENT_REDIRECT = 308,

	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	GONE = 410,
	REQUEST_RANGE_NOT_SATISFIABLE = 416,

	NOT_IMPLEMENTED = 501,
};

constexpr bool
http_status_is_valid(HttpStatus status) noexcept
{
	return (unsigned)status >= 100 && (unsigned)status < 600;
}
