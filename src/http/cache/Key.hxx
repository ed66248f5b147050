// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Default derivation of request keys and URL digests: SHA-256 over a
 * length-prefixed encoding of the inputs, hex-encoded.
 */

#pragma once

#include "Types.hxx"

#include <optional>
#include <string_view>

/**
 * Throws std::runtime_error if the hash function fails.
 *
 * @param bucket an optional partition tag; std::nullopt is
 * different from an empty tag
 */
HttpCacheRequestKey
HttpCacheMakeRequestKey(std::string_view method, std::string_view url,
			std::string_view body,
			std::optional<std::string_view> bucket=std::nullopt);

/**
 * Throws std::runtime_error if the hash function fails.
 */
HttpCacheUrlDigest
HttpCacheMakeUrlDigest(std::string_view url);
