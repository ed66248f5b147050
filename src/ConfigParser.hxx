// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/path.hpp>

struct HttpCacheStoreConfig;

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error.
 */
void
LoadConfigFile(HttpCacheStoreConfig &config,
	       const boost::filesystem::path &path);
