// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/FileLineParser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringAPI.hxx"

#include <stdexcept>

void
Config::Check() const
{
	if (blob_directory.empty())
		throw std::runtime_error{"No blob_store configured"};

	if (pg_conninfo.empty() && record_file.empty())
		throw std::runtime_error{"No record_store configured"};
}

class MediaConfigParser final : public NestedConfigParser {
	Config &config;

	class BlobStore;
	class RecordStore;

public:
	explicit MediaConfigParser(Config &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class NestedConfigParser */
	void ParseLine2(FileLineParser &line) override;
};

class MediaConfigParser::BlobStore final : public ConfigParser {
	Config &config;

public:
	explicit BlobStore(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

void
MediaConfigParser::BlobStore::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "directory"))
		config.blob_directory = line.ExpectPathAndEnd();
	else
		throw FmtRuntimeError("Unknown option '{}'", word);
}

void
MediaConfigParser::BlobStore::Finish()
{
	if (config.blob_directory.empty())
		throw std::runtime_error{"blob_store without directory"};

	ConfigParser::Finish();
}

class MediaConfigParser::RecordStore final : public ConfigParser {
	Config &config;

public:
	explicit RecordStore(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

void
MediaConfigParser::RecordStore::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "postgres"))
		config.pg_conninfo = line.ExpectValueAndEnd();
	else if (StringIsEqual(word, "schema"))
		config.pg_schema = line.ExpectValueAndEnd();
	else if (StringIsEqual(word, "file"))
		config.record_file = line.ExpectPathAndEnd();
	else
		throw FmtRuntimeError("Unknown option '{}'", word);
}

void
MediaConfigParser::RecordStore::Finish()
{
	if (config.pg_conninfo.empty() == config.record_file.empty())
		throw std::runtime_error{"record_store needs either 'postgres' or 'file'"};

	if (!config.pg_schema.empty() && config.pg_conninfo.empty())
		throw std::runtime_error{"'schema' requires 'postgres'"};

	ConfigParser::Finish();
}

void
MediaConfigParser::ParseLine2(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "listen")) {
		config.listen = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "workers")) {
		config.workers = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "idle_timeout")) {
		config.idle_timeout = line.NextPositiveSeconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "storage_timeout")) {
		config.storage_timeout = line.NextPositiveSeconds();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "cache_max_age")) {
		config.cache_max_age = std::chrono::seconds{line.NextUnsigned64()};
		line.ExpectEnd();
	} else if (StringIsEqual(word, "blob_store")) {
		line.ExpectSymbolAndEol('{');
		SetChild(std::make_unique<BlobStore>(config));
	} else if (StringIsEqual(word, "record_store")) {
		line.ExpectSymbolAndEol('{');
		config.pg_conninfo.clear();
		config.pg_schema.clear();
		config.record_file.clear();
		SetChild(std::make_unique<RecordStore>(config));
	} else
		throw FmtRuntimeError("Unknown option '{}'", word);
}

void
LoadConfigFile(Config &config, const std::filesystem::path &path)
{
	MediaConfigParser parser{config};
	CommentConfigParser comment_parser{parser};
	IncludeConfigParser include_parser{std::filesystem::path{path}, comment_parser};
	ParseConfigFile(path, include_parser);
}
