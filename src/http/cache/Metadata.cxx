// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Metadata.hxx"
#include "Error.hxx"

#include <fmt/format.h>

using std::string_view_literals::operator""sv;

const char *
ToString(HttpCacheTtlSource source) noexcept
{
	switch (source) {
	case HttpCacheTtlSource::HEADER:
		return "header";

	case HttpCacheTtlSource::HEURISTIC:
		return "heuristic";
	}

	return "?";
}

const HttpContentRange *
HttpCacheMetadata::GetContentRange() const noexcept
{
	auto i = parsed_headers.find("content-range"sv);
	if (i == parsed_headers.end())
		return nullptr;

	return std::get_if<HttpContentRange>(&i->second);
}

void
HttpCacheMetadata::Validate() const
{
	if (created > expires)
		throw HttpCacheInvalidMetadata{
			fmt::format("created ({}) is after expires ({})",
				    created.time_since_epoch().count(),
				    expires.time_since_epoch().count())};

	if (expires > grace)
		throw HttpCacheInvalidMetadata{
			fmt::format("expires ({}) is after grace ({})",
				    expires.time_since_epoch().count(),
				    grace.time_since_epoch().count())};

	if (auto i = parsed_headers.find("content-range"sv);
	    i != parsed_headers.end() &&
	    !std::holds_alternative<HttpContentRange>(i->second))
		throw HttpCacheInvalidMetadata{"Malformed content-range"};
}
