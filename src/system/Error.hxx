// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <system_error>
#include <utility>

#include <errno.h>

static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(code, std::system_category(), msg);
}

static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

template<typename... Args>
static inline std::system_error
FmtErrno(int code, fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return MakeErrno(code,
			 fmt::format(format_str,
				     std::forward<Args>(args)...).c_str());
}

template<typename... Args>
static inline std::system_error
FmtErrno(fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	return FmtErrno(errno, format_str, std::forward<Args>(args)...);
}

[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return e.code().category() == std::system_category() &&
		(e.code().value() == ENOENT || e.code().value() == ENOTDIR);
}
