// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/cache/Metadata.hxx"

#include <cstdint>
#include <optional>

static constexpr HttpCacheTime
At(int64_t seconds) noexcept
{
	return HttpCacheTime{std::chrono::seconds{seconds}};
}

static inline HttpCacheMetadata
MakeMetadata(int64_t created, int64_t expires, int64_t grace)
{
	HttpCacheMetadata m;
	m.created = At(created);
	m.expires = At(expires);
	m.grace = At(grace);
	return m;
}

static inline HttpCacheMetadata
MakePartialMetadata(int64_t created, int64_t expires, int64_t grace,
		    uint64_t first, uint64_t last,
		    std::optional<uint64_t> complete_length)
{
	auto m = MakeMetadata(created, expires, grace);
	m.SetContentRange({first, last, complete_length});
	return m;
}
