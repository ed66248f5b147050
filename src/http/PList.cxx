// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PList.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>

template<typename F>
static std::vector<std::string>
SplitList(std::string_view p, F &&transform)
{
	std::vector<std::string> result;

	while (!p.empty()) {
		/* find the next delimiter */
		const auto comma = p.find(',');
		std::string_view item = p.substr(0, comma);

		/* delete surrounding whitespace */
		item = Strip(item);

		/* append new list item */
		if (!item.empty()) {
			std::string &dest = result.emplace_back(item);
			std::transform(dest.begin(), dest.end(), dest.begin(),
				       transform);
		}

		if (comma == p.npos)
			/* this was the last element */
			break;

		/* continue after the comma */
		p.remove_prefix(comma + 1);
	}

	return result;
}

std::vector<std::string>
http_list_split(std::string_view p)
{
	return SplitList(p, ToLowerASCII);
}

std::vector<std::string>
http_list_split_verbatim(std::string_view p)
{
	return SplitList(p, [](char ch){ return ch; });
}
