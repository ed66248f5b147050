// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Vary.hxx"
#include "Headers.hxx"
#include "http/PList.hxx"
#include "util/StringStrip.hxx"

using std::string_view_literals::operator""sv;

bool
HttpCacheVaryFits(const HttpCacheVary &stored,
		  const HttpCacheVary &request) noexcept
{
	for (const auto &[name, value] : stored) {
		const auto i = request.find(name);
		if (i == request.end()) {
			if (value)
				/* the request does not have this header */
				return false;
		} else if (value != i->second)
			/* mismatch in one of the "Vary" request headers */
			return false;
	}

	return true;
}

/**
 * Look up a request header and normalize its value.
 */
static std::optional<std::string>
GetVaryValue(const HttpCacheHeaders &request_headers, std::string_view name)
{
	const auto *value = HttpCacheGetHeader(request_headers, name);
	if (value == nullptr)
		return std::nullopt;

	return std::string{Strip(*value)};
}

std::optional<HttpCacheVary>
HttpCacheCopyVary(std::string_view vary,
		  const HttpCacheHeaders &request_headers)
{
	HttpCacheVary result;

	for (auto &name : http_list_split(vary)) {
		if (name == "*"sv)
			/* RFC 7231 7.1.4: a "Vary" value of "*" always
			   fails to match */
			return std::nullopt;

		auto value = GetVaryValue(request_headers, name);
		result.insert_or_assign(std::move(name), std::move(value));
	}

	return result;
}

HttpCacheVary
HttpCacheRequestVary(const std::vector<std::string> &names,
		     const HttpCacheHeaders &request_headers)
{
	HttpCacheVary result;

	for (const auto &name : names)
		result.insert_or_assign(name,
					GetVaryValue(request_headers, name));

	return result;
}
