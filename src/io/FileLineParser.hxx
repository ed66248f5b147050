// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LineParser.hxx"

#include <boost/filesystem/path.hpp>

/**
 * A #LineParser which knows the path of the file being parsed, so
 * relative paths can be resolved against it.
 */
class FileLineParser : public LineParser {
	const boost::filesystem::path &base_path;

public:
	FileLineParser(const boost::filesystem::path &_base_path, char *_p) noexcept
		:LineParser(_p), base_path(_base_path) {}

	boost::filesystem::path ExpectPath();
	boost::filesystem::path ExpectPathAndEnd();
};
