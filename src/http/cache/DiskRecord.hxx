// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Types.hxx"

#include <cstdint>
#include <string>
#include <string_view>

/**
 * Everything the disk store keeps about one response, except its
 * body.
 */
struct HttpCacheDiskRecord {
	HttpCacheRequestKey key;
	HttpCacheUrlDigest url_digest;
	HttpStatus status = HttpStatus::OK;
	HttpCacheHeaders headers;
	HttpCacheVary vary;
	HttpCacheMetadata metadata;
	uint64_t body_size = 0;
};

std::string
SerializeDiskRecord(const HttpCacheDiskRecord &record);

/**
 * Throws #DeserializeError if the record is malformed or truncated,
 * or if its metadata is inconsistent (see HttpCacheMetadata::Validate()).
 */
HttpCacheDiskRecord
DeserializeDiskRecord(std::string_view input);
