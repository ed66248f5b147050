// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Definitions for the record files of the http-cache-store disk
 * backend.
 *
 * A record file is named "RECORD_ID.record" (RECORD_ID being 16
 * lower-case hex digits); its body lives in "RECORD_ID.body".  All
 * integers are big-endian; strings are prefixed with a 32 bit length.
 *
 * Layout:
 *
 *   uint32 magic (DISK_RECORD_MAGIC)
 *   uint16 version (DISK_RECORD_VERSION)
 *   string request_key
 *   string url_digest
 *   uint16 status
 *   uint32 n_headers, followed by (string name, string value) pairs
 *   uint32 n_vary, followed by (string name, uint8 present, [string value])
 *   int64 created, int64 expires, int64 grace (UNIX seconds)
 *   uint8 ttl_set_by (DiskRecordTtlSource)
 *   uint32 n_parsed, followed by (string name, uint8 type, value)
 *   uint32 n_alternate_keys, followed by strings
 *   uint64 body_size
 */

#ifndef HTTP_CACHE_STORE_DISK_RECORD_HXX
#define HTTP_CACHE_STORE_DISK_RECORD_HXX

#include <stdint.h>

namespace HttpCacheStore {

static constexpr uint32_t DISK_RECORD_MAGIC = 0x48435352; /* "HCSR" */

static constexpr uint16_t DISK_RECORD_VERSION = 1;

enum class DiskRecordTtlSource : uint8_t {
    HEADER = 0,
    HEURISTIC = 1,
};

/**
 * The type of a parsed header value in a record file.
 */
enum class DiskRecordValueType : uint8_t {
    /**
     * Payload: string.
     */
    STRING = 1,

    /**
     * Payload: int64.
     */
    INTEGER = 2,

    /**
     * Payload: uint64 first, uint64 last, uint8 has_complete_length,
     * uint64 complete_length (only if has_complete_length is
     * non-zero).
     */
    CONTENT_RANGE = 3,
};

}

#endif
