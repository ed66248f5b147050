// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"
#include "system/Error.hxx"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <fmt/format.h>

#include <assert.h>
#include <string.h>

namespace fs = boost::filesystem;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(FileLineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

bool
VariableConfigParser::PreParseLine(FileLineParser &line)
{
	return child.PreParseLine(line);
}

void
VariableConfigParser::ParseLine(FileLineParser &line)
{
	Expand(line);

	if (line.SkipWord("@set")) {
		const char *name = line.ExpectWordAndSymbol('=',
							    "Variable name expected",
							    "'=' expected");
		const char *value = line.NextUnescape();
		if (value == nullptr)
			throw LineParser::Error("Quoted value expected after '='");

		line.ExpectEnd();

		variables.insert_or_assign(name, value);
	} else {
		child.ParseLine(line);
	}
}

void
VariableConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

void
VariableConfigParser::ExpandOne(std::string &dest,
				const char *&src, const char *end) const
{
	assert(src + 2 <= end);
	assert(*src == '$');
	assert(src[1] == '{');

	src += 2;

	if (src >= end || !LineParser::IsWordChar(*src))
		throw LineParser::Error("Variable name expected after '${'");

	const char *name_begin = src;

	do {
		if (++src >= end)
			throw LineParser::Error("Missing '}' after variable name");
	} while (LineParser::IsWordChar(*src));

	if (*src != '}')
		throw LineParser::Error("Missing '}' after variable name");

	const char *name_end = src++;

	const std::string_view name(name_begin, name_end - name_begin);
	auto i = variables.find(name);
	if (i == variables.end())
		throw LineParser::Error("No such variable: " + std::string(name));

	dest += i->second;
}

void
VariableConfigParser::ExpandQuoted(std::string &dest,
				   const char *src, const char *end) const
{
	while (true) {
		const char *dollar = (const char *)memchr(src, '$', end - src);
		if (dollar == nullptr || dollar + 1 >= end || dollar[1] != '{')
			break;

		dest.append(src, dollar);

		src = dollar;
		ExpandOne(dest, src, end);
	}

	dest.append(src, end);
}

void
VariableConfigParser::Expand(std::string &dest, const char *src) const
{
	while (true) {
		const char ch = *src;
		if (ch == 0)
			break;

		if (ch == '\'') {
			const char *end = strchr(src + 1, '\'');
			if (end == nullptr)
				break;

			++end;
			dest.append(src, end);
			src = end;
		} else if (ch == '"') {
			const char *end = strchr(src + 1, '"');
			if (end == nullptr)
				break;

			dest.push_back(ch);
			ExpandQuoted(dest, src + 1, end);
			dest.push_back(ch);
			src = end + 1;
		} else if (ch == '$' && src[1] == '{') {
			dest.push_back('\'');
			ExpandOne(dest, src, src + strlen(src));
			dest.push_back('\'');
		} else {
			dest.push_back(ch);
			++src;
		}
	}

	dest += src;
}

char *
VariableConfigParser::Expand(const char *src) const
{
	if (strstr(src, "${") == nullptr)
		return nullptr;

	buffer.clear();
	Expand(buffer, src);
	return buffer.data();
}

void
VariableConfigParser::Expand(FileLineParser &line) const
{
	char *p = Expand(line.Rest());
	if (p != nullptr)
		line.Replace(p);
}

bool
IncludeConfigParser::PreParseLine(FileLineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(FileLineParser &line)
{
	if (line.SkipWord("@include")) {
		IncludePath(line.ExpectPathAndEnd());
	} else if (line.SkipWord("@include_optional")) {
		IncludeOptionalPath(line.ExpectPathAndEnd());
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	child.Finish();
}

/**
 * Parse a file, but don't call ConfigParser::Finish(); the included
 * file is only a fragment of the including file.
 */
static void
ParseIncludedFile(const fs::path &path, ConfigParser &parser)
{
	fs::ifstream file{path};
	if (!file)
		throw FmtErrno("Failed to open {}", path.native());

	std::string buffer;
	for (unsigned i = 1; std::getline(file, buffer); ++i) {
		FileLineParser line(path, buffer.data());

		try {
			if (!parser.PreParseLine(line))
				parser.ParseLine(line);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(fmt::format("{}:{}",
									 path.native(), i)));
		}
	}

	if (file.bad())
		throw FmtErrno("Failed to read {}", path.native());
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	IncludeConfigParser sub(std::move(p), child);
	ParseIncludedFile(sub.path, sub);
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	if (!fs::exists(p))
		/* silently ignore missing files */
		return;

	IncludeConfigParser sub(std::move(p), child);
	ParseIncludedFile(sub.path, sub);
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	ParseIncludedFile(path, parser);
	parser.Finish();
}
