// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringStrip.hxx"
#include "CharUtil.hxx"

#include <string.h>

char *
StripLeft(char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;

	return p;
}

void
StripRight(char *p) noexcept
{
	std::size_t length = strlen(p);

	while (length > 0 && IsWhitespaceOrNull(p[length - 1]))
		--length;

	p[length] = 0;
}

std::string_view
Strip(std::string_view s) noexcept
{
	while (!s.empty() && IsWhitespaceOrNull(s.front()))
		s.remove_prefix(1);

	while (!s.empty() && IsWhitespaceOrNull(s.back()))
		s.remove_suffix(1);

	return s;
}
