// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Serialization of simple values into a byte buffer, big-endian.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * Thrown by the deserialize_*() functions when the input is
 * malformed or truncated.
 */
class DeserializeError {};

void
serialize_uint8(std::string &dest, uint8_t value);

void
serialize_uint16(std::string &dest, uint16_t value);

void
serialize_uint32(std::string &dest, uint32_t value);

void
serialize_uint64(std::string &dest, uint64_t value);

void
serialize_int64(std::string &dest, int64_t value);

/**
 * Write a length-prefixed string; unlike C strings, it may contain
 * null bytes.
 */
void
serialize_string(std::string &dest, std::string_view value);

uint8_t
deserialize_uint8(std::string_view &input);

uint16_t
deserialize_uint16(std::string_view &input);

uint32_t
deserialize_uint32(std::string_view &input);

uint64_t
deserialize_uint64(std::string_view &input);

int64_t
deserialize_int64(std::string_view &input);

/**
 * @return a view into the input buffer
 */
std::string_view
deserialize_string(std::string_view &input);
