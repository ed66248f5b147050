// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

/**
 * Set the global log level.  Messages with a level above this value
 * are discarded.  Levels: 1 error, 2 warning, 3 info, 4 debug, 5
 * trace.
 */
void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
unsigned
GetLogLevel() noexcept;

[[gnu::pure]]
static inline bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= GetLogLevel();
}

/**
 * Write one line to the log (stderr), prefixed with the domain.
 */
void
LogMessage(std::string_view domain, std::string_view msg) noexcept;

namespace LoggerDetail {

template<typename T>
void
AppendPart(fmt::memory_buffer &buffer, const T &value)
{
	fmt::format_to(std::back_inserter(buffer), "{}", value);
}

void
AppendPart(fmt::memory_buffer &buffer, const std::exception_ptr &ep);

template<typename... Args>
void
Concat(std::string_view domain, Args&&... args) noexcept
{
	fmt::memory_buffer buffer;
	(AppendPart(buffer, std::forward<Args>(args)), ...);
	LogMessage(domain, {buffer.data(), buffer.size()});
}

} // namespace LoggerDetail

/**
 * A logger with a domain string which is prefixed to all messages.
 *
 * Usage: `logger(level, "part", 42, "part")`; all parts are
 * concatenated.  An `std::exception_ptr` part is formatted with its
 * full nested message chain.
 */
class Logger {
	std::string domain;

public:
	Logger() = default;

	explicit Logger(std::string_view _domain) noexcept
		:domain(_domain) {}

	const std::string &GetDomain() const noexcept {
		return domain;
	}

	static bool CheckLevel(unsigned level) noexcept {
		return CheckLogLevel(level);
	}

	template<typename... Args>
	void operator()(unsigned level, Args&&... args) const noexcept {
		if (CheckLevel(level))
			LoggerDetail::Concat(domain,
					     std::forward<Args>(args)...);
	}

	template<typename... Args>
	void Fmt(unsigned level, fmt::format_string<Args...> format_str,
		 Args&&... args) const noexcept {
		if (CheckLevel(level))
			LogMessage(domain,
				   fmt::format(format_str,
					       std::forward<Args>(args)...));
	}
};
