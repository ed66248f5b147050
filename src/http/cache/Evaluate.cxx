// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Evaluate.hxx"
#include "Headers.hxx"
#include "http/Date.hxx"
#include "http/PList.hxx"
#include "io/Logger.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <algorithm>
#include <cstdint>

using std::string_view_literals::operator""sv;

static const Logger logger{"HttpCache"};

bool
HttpCacheRequestEvaluate(std::string_view method,
			 const HttpCacheHeaders &headers,
			 bool has_request_body) noexcept
{
	if ((method != "GET"sv && method != "HEAD"sv) || has_request_body)
		/* RFC 7234 2: only GET is cached by most caches */
		return false;

	/* RFC 7234 3.2: a shared cache must not use a cached response
	   for a request with an "Authorization" header */
	if (HttpCacheGetHeader(headers, "authorization"sv) != nullptr)
		return false;

	if (const auto *p = HttpCacheGetHeader(headers, "cache-control"sv)) {
		for (const auto &s : http_list_split(*p))
			if (s == "no-store"sv)
				return false;
	}

	return true;
}

bool
HttpCacheRequestInvalidate(std::string_view method) noexcept
{
	return method == "PUT"sv || method == "DELETE"sv ||
		method == "POST"sv || method == "PATCH"sv;
}

/**
 * RFC 7231 6.1: status codes which are cacheable by default.
 */
static constexpr bool
http_status_cacheable(HttpStatus status) noexcept
{
	switch (status) {
	case HttpStatus::OK:
	case HttpStatus::NON_AUTHORITATIVE_INFORMATION:
	case HttpStatus::NO_CONTENT:
	case HttpStatus::PARTIAL_CONTENT:
	case HttpStatus::MULTIPLE_CHOICES:
	case HttpStatus::MOVED_PERMANENTLY:
	case HttpStatus::PERMANENT_REDIRECT:
	case HttpStatus::NOT_FOUND:
	case HttpStatus::METHOD_NOT_ALLOWED:
	case HttpStatus::GONE:
	case HttpStatus::NOT_IMPLEMENTED:
		return true;

	default:
		return false;
	}
}

/**
 * Parse a non-negative decimal integer.  Values above #max are
 * clipped.
 */
[[gnu::pure]]
static std::optional<int64_t>
ParseDecimal(std::string_view s, int64_t max) noexcept
{
	if (s.empty())
		return std::nullopt;

	int64_t value = 0;
	for (char ch : s) {
		if (!IsDigitASCII(ch))
			return std::nullopt;

		const int digit = ch - '0';
		if (value > (max - digit) / 10)
			value = max;
		else
			value = value * 10 + digit;
	}

	return value;
}

/**
 * Parse a "delta-seconds" value (RFC 7234 1.2.1).
 */
[[gnu::pure]]
static std::optional<std::chrono::seconds>
ParseDeltaSeconds(std::string_view s) noexcept
{
	/* RFC 7234 1.2.1: "2147483648 (2^31)" is the recommended
	   upper limit */
	const auto value = ParseDecimal(Strip(s), int64_t{1} << 31);
	if (!value)
		return std::nullopt;

	return std::chrono::seconds{*value};
}

[[gnu::pure]]
static std::optional<std::chrono::seconds>
GetDirectiveSeconds(std::string_view directive, std::string_view name) noexcept
{
	if (!directive.starts_with(name) ||
	    directive.size() <= name.size() ||
	    directive[name.size()] != '=')
		return std::nullopt;

	auto value = directive.substr(name.size() + 1);
	if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
		value = value.substr(1, value.size() - 2);

	return ParseDeltaSeconds(value);
}

[[gnu::pure]]
static bool
IsDirective(std::string_view directive, std::string_view name) noexcept
{
	return directive == name ||
		(directive.starts_with(name) &&
		 directive.size() > name.size() &&
		 directive[name.size()] == '=');
}

[[gnu::pure]]
static std::optional<HttpCacheTime>
GetDateHeader(const HttpCacheHeaders &headers, std::string_view name) noexcept
{
	const auto *value = HttpCacheGetNonEmptyHeader(headers, name);
	if (value == nullptr)
		return std::nullopt;

	return http_date_parse(*value);
}

std::optional<HttpCacheMetadata>
HttpCacheEvaluateResponse(HttpStatus status, const HttpCacheHeaders &headers,
			  HttpCacheTime now,
			  const HttpCacheEvaluateConfig &config)
{
	if (!http_status_cacheable(status))
		return std::nullopt;

	std::optional<std::chrono::seconds> s_maxage, max_age;

	if (const auto *p = HttpCacheGetHeader(headers, "cache-control"sv)) {
		for (const auto &s : http_list_split(*p)) {
			if (IsDirective(s, "private"sv) ||
			    IsDirective(s, "no-cache"sv) ||
			    s == "no-store"sv)
				return std::nullopt;

			if (auto sm = GetDirectiveSeconds(s, "s-maxage"sv))
				s_maxage = sm;
			else if (auto ma = GetDirectiveSeconds(s, "max-age"sv))
				max_age = ma;
		}
	}

	if (const auto *p = HttpCacheGetNonEmptyHeader(headers, "vary"sv);
	    p != nullptr && Strip(*p) == "*"sv)
		/* RFC 7231 7.1.4: "Vary: *" always fails to match */
		return std::nullopt;

	HttpCacheMetadata metadata;
	metadata.created = now;

	if (status == HttpStatus::PARTIAL_CONTENT) {
		const auto *p = HttpCacheGetHeader(headers, "content-range"sv);
		if (p == nullptr)
			return std::nullopt;

		const auto range = HttpContentRange::Parse(*p);
		if (!range) {
			logger(4, "malformed 'content-range' header");
			return std::nullopt;
		}

		metadata.SetContentRange(*range);
	}

	/* the server's clock; expiry times are relative to it */
	const auto date = GetDateHeader(headers, "date"sv).value_or(now);

	std::optional<std::chrono::seconds> ttl;
	if (s_maxage)
		/* RFC 7234 5.2.2.9: shared caches prefer "s-maxage" */
		ttl = s_maxage;
	else if (max_age)
		/* RFC 7234 5.3: "max-age" overrides "Expires" */
		ttl = max_age;
	else if (HttpCacheGetHeader(headers, "expires"sv) != nullptr) {
		if (const auto expires = GetDateHeader(headers, "expires"sv))
			ttl = std::max(std::chrono::seconds::zero(),
				       std::chrono::seconds{*expires - date});
		else {
			/* RFC 7234 5.3: an invalid date means "already
			   expired" */
			logger(4, "invalid 'expires' header");
			ttl = std::chrono::seconds::zero();
		}
	}

	if (ttl) {
		metadata.ttl_set_by = HttpCacheTtlSource::HEADER;

		/* RFC 7234 4.2.3: subtract the age the response had
		   when we received it */
		if (const auto *age = HttpCacheGetHeader(headers, "age"sv))
			if (const auto a = ParseDeltaSeconds(*age))
				ttl = std::max(std::chrono::seconds::zero(),
					       *ttl - *a);
	} else {
		metadata.ttl_set_by = HttpCacheTtlSource::HEURISTIC;

		/* RFC 7234 4.2.2: a fraction of the interval since
		   the last modification */
		const auto last_modified = GetDateHeader(headers, "last-modified"sv);
		if (last_modified && *last_modified < date)
			ttl = std::min(std::chrono::seconds{(date - *last_modified) / 10},
				       config.max_heuristic_ttl);
		else
			ttl = config.default_ttl;
	}

	metadata.expires = now + *ttl;
	metadata.grace = metadata.expires + config.grace;

	if (const auto *etag = HttpCacheGetNonEmptyHeader(headers, "etag"sv))
		metadata.parsed_headers.emplace("etag", *etag);

	if (const auto last_modified = GetDateHeader(headers, "last-modified"sv))
		metadata.parsed_headers.emplace("last-modified",
						int64_t{last_modified->time_since_epoch().count()});

	if (const auto *p = HttpCacheGetHeader(headers, "content-length"sv))
		if (const auto length = ParseDecimal(Strip(*p), INT64_MAX))
			metadata.parsed_headers.emplace("content-length", *length);

	if (!config.alternate_keys_header.empty())
		if (const auto *p = HttpCacheGetHeader(headers, config.alternate_keys_header))
			for (auto &key : http_list_split_verbatim(*p))
				metadata.alternate_keys.emplace(std::move(key));

	return metadata;
}
