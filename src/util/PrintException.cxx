// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PrintException.hxx"
#include "Exception.hxx"

#include <fmt/format.h>

#include <stdio.h>

void
PrintException(const std::exception &e) noexcept
{
	fmt::print(stderr, "{}\n", GetFullMessage(e, "Unknown exception", "\n"));
}

void
PrintException(const std::exception_ptr &ep) noexcept
{
	fmt::print(stderr, "{}\n", GetFullMessage(ep, "Unknown exception", "\n"));
}
