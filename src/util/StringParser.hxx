// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Parsers for configuration values.  All of them throw
 * std::invalid_argument on error.
 */

#pragma once

#include <cstddef>

bool
ParseBool(const char *s);

unsigned long
ParseUnsignedLong(const char *s);

/**
 * Parse a positive integer not larger than #max_value.
 */
unsigned long
ParsePositiveLong(const char *s, unsigned long max_value);

/**
 * Parse a byte size with an optional "k", "M" or "G" suffix (powers
 * of 1024).
 */
std::size_t
ParseSize(const char *s);
