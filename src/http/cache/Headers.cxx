// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Headers.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>

[[gnu::pure]]
static bool
EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
	return a.size() == b.size() &&
		std::equal(a.begin(), a.end(), b.begin(), [](char x, char y){
			return ToLowerASCII(x) == ToLowerASCII(y);
		});
}

const std::string *
HttpCacheGetHeader(const HttpCacheHeaders &headers,
		   std::string_view name) noexcept
{
	for (const auto &[key, value] : headers)
		if (EqualsIgnoreCase(key, name))
			return &value;

	return nullptr;
}

const std::string *
HttpCacheGetNonEmptyHeader(const HttpCacheHeaders &headers,
			   std::string_view name) noexcept
{
	const auto *value = HttpCacheGetHeader(headers, name);
	if (value != nullptr && value->empty())
		value = nullptr;
	return value;
}
