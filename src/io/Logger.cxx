// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"
#include "util/Exception.hxx"

#include <atomic>

#include <stdio.h>

static std::atomic_uint log_level{1};

void
SetLogLevel(unsigned level) noexcept
{
	log_level.store(level, std::memory_order_relaxed);
}

unsigned
GetLogLevel() noexcept
{
	return log_level.load(std::memory_order_relaxed);
}

void
LogMessage(std::string_view domain, std::string_view msg) noexcept
{
	if (domain.empty())
		fmt::print(stderr, "{}\n", msg);
	else
		fmt::print(stderr, "{}: {}\n", domain, msg);
}

namespace LoggerDetail {

void
AppendPart(fmt::memory_buffer &buffer, const std::exception_ptr &ep)
{
	const auto msg = GetFullMessage(ep);
	buffer.append(msg.data(), msg.data() + msg.size());
}

} // namespace LoggerDetail
