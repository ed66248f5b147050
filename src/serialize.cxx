// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "serialize.hxx"

#include <boost/endian/conversion.hpp>

#include <type_traits>

#include <string.h>

template<typename T>
static void
SerializeT(std::string &dest, T value)
{
	static_assert(std::is_integral_v<T>, "type is not integral");

	boost::endian::native_to_big_inplace(value);
	dest.append((const char *)&value, sizeof(value));
}

void
serialize_uint8(std::string &dest, uint8_t value)
{
	dest.push_back((char)value);
}

void
serialize_uint16(std::string &dest, uint16_t value)
{
	SerializeT(dest, value);
}

void
serialize_uint32(std::string &dest, uint32_t value)
{
	SerializeT(dest, value);
}

void
serialize_uint64(std::string &dest, uint64_t value)
{
	SerializeT(dest, value);
}

void
serialize_int64(std::string &dest, int64_t value)
{
	serialize_uint64(dest, (uint64_t)value);
}

void
serialize_string(std::string &dest, std::string_view value)
{
	serialize_uint32(dest, value.size());
	dest.append(value);
}

template<typename T>
static T
DeserializeT(std::string_view &input)
{
	static_assert(std::is_integral_v<T>, "type is not integral");

	T value;
	if (input.size() < sizeof(value)) [[unlikely]]
		throw DeserializeError();

	memcpy(&value, input.data(), sizeof(value));
	input.remove_prefix(sizeof(value));
	return boost::endian::big_to_native(value);
}

uint8_t
deserialize_uint8(std::string_view &input)
{
	return DeserializeT<uint8_t>(input);
}

uint16_t
deserialize_uint16(std::string_view &input)
{
	return DeserializeT<uint16_t>(input);
}

uint32_t
deserialize_uint32(std::string_view &input)
{
	return DeserializeT<uint32_t>(input);
}

uint64_t
deserialize_uint64(std::string_view &input)
{
	return DeserializeT<uint64_t>(input);
}

int64_t
deserialize_int64(std::string_view &input)
{
	return (int64_t)deserialize_uint64(input);
}

std::string_view
deserialize_string(std::string_view &input)
{
	const std::size_t length = deserialize_uint32(input);
	if (input.size() < length) [[unlikely]]
		throw DeserializeError();

	const auto value = input.substr(0, length);
	input.remove_prefix(length);
	return value;
}
