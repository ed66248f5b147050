// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Range.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <fmt/format.h>

using std::string_view_literals::operator""sv;

/**
 * Parse a non-negative decimal integer which must span the whole
 * string.
 */
static std::optional<uint64_t>
ParseUint64(std::string_view s) noexcept
{
	if (s.empty() || s.size() > 19)
		return std::nullopt;

	uint64_t value = 0;
	for (char ch : s) {
		if (!IsDigitASCII(ch))
			return std::nullopt;

		value = value * 10 + (ch - '0');
	}

	return value;
}

static bool
SkipPrefix(std::string_view &s, std::string_view prefix) noexcept
{
	if (!s.starts_with(prefix))
		return false;

	s.remove_prefix(prefix.size());
	return true;
}

std::optional<HttpRangeRequest>
HttpRangeRequest::Parse(std::string_view s) noexcept
{
	s = Strip(s);
	if (!SkipPrefix(s, "bytes="sv))
		return std::nullopt;

	if (s.find(',') != s.npos)
		/* multiple ranges are not supported */
		return std::nullopt;

	const auto dash = s.find('-');
	if (dash == s.npos)
		return std::nullopt;

	const auto first_s = Strip(s.substr(0, dash));
	const auto last_s = Strip(s.substr(dash + 1));

	if (first_s.empty()) {
		const auto length = ParseUint64(last_s);
		if (!length || *length == 0)
			return std::nullopt;

		return Suffix(*length);
	}

	const auto first = ParseUint64(first_s);
	if (!first)
		return std::nullopt;

	if (last_s.empty())
		return OpenEnded(*first);

	const auto last = ParseUint64(last_s);
	if (!last || *last < *first)
		return std::nullopt;

	return Closed(*first, *last);
}

std::string
HttpRangeRequest::Format() const
{
	switch (type) {
	case Type::CLOSED:
		return fmt::format("bytes={}-{}", first, last);

	case Type::OPEN_ENDED:
		return fmt::format("bytes={}-", first);

	case Type::SUFFIX:
		return fmt::format("bytes=-{}", first);
	}

	return {};
}

std::optional<HttpContentRange>
HttpContentRange::Parse(std::string_view s) noexcept
{
	s = Strip(s);
	if (!SkipPrefix(s, "bytes "sv))
		return std::nullopt;

	s = Strip(s);

	const auto slash = s.find('/');
	if (slash == s.npos)
		return std::nullopt;

	const auto range_s = s.substr(0, slash);
	const auto length_s = Strip(s.substr(slash + 1));

	const auto dash = range_s.find('-');
	if (dash == range_s.npos)
		return std::nullopt;

	const auto first = ParseUint64(Strip(range_s.substr(0, dash)));
	const auto last = ParseUint64(Strip(range_s.substr(dash + 1)));
	if (!first || !last || *last < *first)
		return std::nullopt;

	HttpContentRange result{*first, *last, std::nullopt};

	if (length_s != "*"sv) {
		const auto length = ParseUint64(length_s);
		if (!length || *last >= *length)
			return std::nullopt;

		result.complete_length = *length;
	}

	return result;
}

std::string
HttpContentRange::Format() const
{
	if (complete_length)
		return fmt::format("bytes {}-{}/{}", first, last,
				   *complete_length);
	else
		return fmt::format("bytes {}-{}/*", first, last);
}

bool
HttpContentRange::Covers(const HttpRangeRequest &range) const noexcept
{
	switch (range.type) {
	case HttpRangeRequest::Type::CLOSED:
		{
			uint64_t range_last = range.last;

			if (complete_length) {
				if (range.first >= *complete_length)
					/* not satisfiable at all */
					return false;

				/* RFC 7233 2.1: a "last" beyond the end
				   of the resource means "until the end" */
				if (range_last >= *complete_length)
					range_last = *complete_length - 1;
			}

			return first <= range.first && range_last <= last;
		}

	case HttpRangeRequest::Type::OPEN_ENDED:
		return complete_length &&
			range.first < *complete_length &&
			first <= range.first &&
			last + 1 == *complete_length;

	case HttpRangeRequest::Type::SUFFIX:
		{
			if (!complete_length)
				return false;

			const uint64_t range_first =
				range.first >= *complete_length
				? 0
				: *complete_length - range.first;
			return first <= range_first &&
				last + 1 == *complete_length;
		}
	}

	return false;
}
