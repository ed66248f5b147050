// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * Skips whitespace at the beginning of the string.
 */
[[gnu::pure]] [[gnu::returns_nonnull]] [[gnu::nonnull]]
char *
StripLeft(char *p) noexcept;

/**
 * Null-terminates the string after its last non-whitespace
 * character.
 */
[[gnu::nonnull]]
void
StripRight(char *p) noexcept;

[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;
