// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringParser.hxx"

#include <limits>
#include <stdexcept>

#include <stdlib.h>
#include <string.h>

bool
ParseBool(const char *s)
{
	if (strcmp(s, "yes") == 0)
		return true;
	else if (strcmp(s, "no") == 0)
		return false;
	else
		throw std::invalid_argument("Failed to parse boolean; \"yes\" or \"no\" expected");
}

unsigned long
ParseUnsignedLong(const char *s)
{
	char *endptr;
	const auto value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || *s == '-')
		throw std::invalid_argument("Failed to parse number");

	return value;
}

unsigned long
ParsePositiveLong(const char *s, unsigned long max_value)
{
	const auto value = ParseUnsignedLong(s);
	if (value <= 0)
		throw std::invalid_argument("Value must be positive");

	if (value > max_value)
		throw std::invalid_argument("Value is too large");

	return value;
}

std::size_t
ParseSize(const char *s)
{
	char *endptr;
	std::size_t value = strtoul(s, &endptr, 10);
	if (endptr == s || *s == '-')
		throw std::invalid_argument("Failed to parse size");

	unsigned shift = 0;
	switch (*endptr) {
	case 'k':
		shift = 10;
		++endptr;
		break;

	case 'M':
		shift = 20;
		++endptr;
		break;

	case 'G':
		shift = 30;
		++endptr;
		break;
	}

	if (*endptr != 0)
		throw std::invalid_argument("Unknown size suffix");

	if (value > (std::numeric_limits<std::size_t>::max() >> shift))
		throw std::invalid_argument("Size is too large");

	return value << shift;
}
