// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Byte ranges: the "Range" request header and the "Content-Range"
 * response header (RFC 7233).  All ranges are closed intervals, just
 * like on the wire.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * A parsed "Range" request header.  Only a single byte range is
 * supported; multipart ranges are rejected by Parse().
 */
struct HttpRangeRequest {
	enum class Type : uint8_t {
		/**
		 * "bytes=first-last"
		 */
		CLOSED,

		/**
		 * "bytes=first-": from #first to the end of the
		 * resource.
		 */
		OPEN_ENDED,

		/**
		 * "bytes=-length": the last #length bytes of the
		 * resource.
		 */
		SUFFIX,
	};

	Type type;

	/**
	 * The first byte (CLOSED, OPEN_ENDED) or the suffix length
	 * (SUFFIX).
	 */
	uint64_t first;

	/**
	 * The last byte (inclusive); only used for CLOSED.
	 */
	uint64_t last;

	static constexpr HttpRangeRequest Closed(uint64_t first,
						 uint64_t last) noexcept {
		return {Type::CLOSED, first, last};
	}

	static constexpr HttpRangeRequest OpenEnded(uint64_t first) noexcept {
		return {Type::OPEN_ENDED, first, 0};
	}

	static constexpr HttpRangeRequest Suffix(uint64_t length) noexcept {
		return {Type::SUFFIX, length, 0};
	}

	[[gnu::pure]]
	static std::optional<HttpRangeRequest> Parse(std::string_view s) noexcept;

	std::string Format() const;

	constexpr bool operator==(const HttpRangeRequest &) const noexcept = default;
};

/**
 * A parsed "Content-Range" response header of a partial response.
 */
struct HttpContentRange {
	uint64_t first, last;

	/**
	 * The size of the complete resource; std::nullopt if the server
	 * sent "*".
	 */
	std::optional<uint64_t> complete_length;

	/**
	 * Parse "bytes first-last/length", or the same with an asterisk
	 * instead of the length.  The unsatisfied form with an asterisk
	 * instead of the range is rejected; it does not describe a
	 * partial body.
	 */
	[[gnu::pure]]
	static std::optional<HttpContentRange> Parse(std::string_view s) noexcept;

	std::string Format() const;

	constexpr uint64_t GetSize() const noexcept {
		return last - first + 1;
	}

	/**
	 * Does this partial body contain all bytes requested by the
	 * given range (exactly or as a superset)?  Open-ended and
	 * suffix ranges can only be checked if the complete length is
	 * known.
	 */
	[[gnu::pure]]
	bool Covers(const HttpRangeRequest &range) const noexcept;

	constexpr bool operator==(const HttpContentRange &) const noexcept = default;
};
