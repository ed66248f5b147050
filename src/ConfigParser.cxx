// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "Config.hxx"
#include "io/ConfigParser.hxx"
#include "io/FileLineParser.hxx"

#include <string.h>

class HttpCacheStoreConfigParser final : public ConfigParser {
	HttpCacheStoreConfig &config;

public:
	explicit HttpCacheStoreConfigParser(HttpCacheStoreConfig &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

static HttpCacheStoreConfig::StoreType
ParseStoreType(const char *s)
{
	if (strcmp(s, "heap") == 0)
		return HttpCacheStoreConfig::StoreType::HEAP;
	else if (strcmp(s, "disk") == 0)
		return HttpCacheStoreConfig::StoreType::DISK;
	else
		throw LineParser::Error("Unknown store type");
}

void
HttpCacheStoreConfigParser::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (strcmp(word, "store") == 0) {
		config.store = ParseStoreType(line.ExpectWord());
		line.ExpectEnd();
	} else if (strcmp(word, "path") == 0) {
		config.path = line.ExpectPathAndEnd();
	} else if (strcmp(word, "set") == 0) {
		const char *name = line.ExpectWord();
		line.ExpectSymbol('=');
		const char *value = line.ExpectValueAndEnd();
		config.HandleSet(name, value);
	} else
		throw LineParser::Error("Unknown option");
}

void
HttpCacheStoreConfigParser::Finish()
{
	config.Check();
}

void
LoadConfigFile(HttpCacheStoreConfig &config,
	       const boost::filesystem::path &path)
{
	HttpCacheStoreConfigParser parser(config);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);
	IncludeConfigParser parser3(boost::filesystem::path{path}, parser2);

	ParseConfigFile(path, parser3);
}
