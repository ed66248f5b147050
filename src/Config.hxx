// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/cache/Evaluate.hxx"
#include "http/cache/Select.hxx"

#include <boost/filesystem/path.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

/**
 * Configuration of a cache store instance.
 */
struct HttpCacheStoreConfig {
	enum class StoreType : uint8_t {
		HEAP,
		DISK,
	};

	StoreType store = StoreType::HEAP;

	/**
	 * The directory of the disk store.
	 */
	boost::filesystem::path path;

	/**
	 * The size limit of the heap store [bytes].
	 */
	std::size_t max_size = 64 * 1024 * 1024;

	HttpCacheSelectorConfig selector;

	HttpCacheEvaluateConfig evaluate;

	/**
	 * Handle a "set name = value" line.  Throws on error.
	 */
	void HandleSet(std::string_view name, const char *value);

	/**
	 * Check the configuration for consistency after it has been
	 * loaded.  Throws on error.
	 */
	void Check() const;
};

[[gnu::const]]
const char *
ToString(HttpCacheStoreConfig::StoreType type) noexcept;
