// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Date.hxx"

#include <time.h>

static constexpr const char *http_date_formats[] = {
	"%a, %d %b %Y %H:%M:%S GMT",
	"%A, %d-%b-%y %H:%M:%S GMT",
	"%a %b %e %H:%M:%S %Y",
};

std::optional<std::chrono::sys_seconds>
http_date_parse(std::string_view s) noexcept
{
	char buffer[64];
	if (s.size() >= sizeof(buffer))
		return std::nullopt;

	s.copy(buffer, s.size());
	buffer[s.size()] = 0;

	for (const char *format : http_date_formats) {
		struct tm tm{};
		const char *end = strptime(buffer, format, &tm);
		if (end == nullptr || *end != 0)
			continue;

		const time_t t = timegm(&tm);
		if (t == (time_t)-1)
			return std::nullopt;

		return std::chrono::sys_seconds{std::chrono::seconds{t}};
	}

	return std::nullopt;
}

std::string
http_date_format(std::chrono::sys_seconds t)
{
	const time_t tt = t.time_since_epoch().count();
	struct tm tm;
	if (gmtime_r(&tt, &tm) == nullptr)
		return {};

	char buffer[64];
	const std::size_t length = strftime(buffer, sizeof(buffer),
					    http_date_formats[0], &tm);
	return {buffer, length};
}
