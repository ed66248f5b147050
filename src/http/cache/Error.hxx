// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * A cache store backend has failed (I/O error, corrupt storage).
 * This is never to be confused with a cache miss; it may carry a
 * nested cause (std::throw_with_nested()).
 */
class HttpCacheStoreError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The caller has passed malformed #HttpCacheMetadata.  Thrown before
 * the backend is invoked; nothing has been stored.
 */
class HttpCacheInvalidMetadata : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};
