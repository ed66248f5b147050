// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "serialize.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(Serialize, BigEndian)
{
	std::string s;
	serialize_uint16(s, 0x0102);
	serialize_uint32(s, 0x03040506);
	serialize_uint64(s, 0x0708090a0b0c0d0e);
	serialize_int64(s, -2);

	EXPECT_EQ(s, "\x01\x02\x03\x04\x05\x06\x07\x08\x09\x0a\x0b\x0c\x0d\x0e"
		  "\xff\xff\xff\xff\xff\xff\xff\xfe"sv);

	std::string_view input = s;
	EXPECT_EQ(deserialize_uint16(input), 0x0102);
	EXPECT_EQ(deserialize_uint32(input), 0x03040506u);
	EXPECT_EQ(deserialize_uint64(input), 0x0708090a0b0c0d0eu);
	EXPECT_EQ(deserialize_int64(input), -2);
	EXPECT_TRUE(input.empty());
}

TEST(Serialize, String)
{
	std::string s;
	serialize_string(s, "foo\0bar"sv);
	serialize_string(s, {});

	std::string_view input = s;
	EXPECT_EQ(deserialize_string(input), "foo\0bar"sv);
	EXPECT_EQ(deserialize_string(input), ""sv);
	EXPECT_TRUE(input.empty());
}

TEST(Serialize, Truncated)
{
	std::string s;
	serialize_uint32(s, 42);

	std::string_view input = std::string_view{s}.substr(0, 3);
	EXPECT_THROW(deserialize_uint32(input), DeserializeError);

	s.clear();
	serialize_string(s, "hello");
	s.pop_back();

	input = s;
	EXPECT_THROW(deserialize_string(input), DeserializeError);

	input = {};
	EXPECT_THROW(deserialize_uint8(input), DeserializeError);
}
