// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RecordFile.hxx"
#include "MemoryRecordStore.hxx"
#include "io/config/FileLineParser.hxx"
#include "time/ISO8601.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringAPI.hxx"

namespace Media {

class RecordFileParser::MediaBlock final : public ConfigParser {
	Record record;

	bool have_size = false;

public:
	explicit MediaBlock(const char *id) noexcept {
		record.id = id;
	}

	Record &&Steal() noexcept {
		return std::move(record);
	}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

void
RecordFileParser::MediaBlock::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "key")) {
		record.key = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "name")) {
		record.file_name = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "type")) {
		record.content_type = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "size")) {
		record.size = line.NextUnsigned64();
		line.ExpectEnd();
		have_size = true;
	} else if (StringIsEqual(word, "created")) {
		record.created = ParseISO8601(line.ExpectValueAndEnd());
	} else
		throw FmtRuntimeError("Unknown option '{}'", word);
}

void
RecordFileParser::MediaBlock::Finish()
{
	if (record.key.empty())
		throw FmtRuntimeError("Media '{}' has no key", record.id);

	if (!have_size)
		throw FmtRuntimeError("Media '{}' has no size", record.id);

	if (record.file_name.empty())
		/* fall back to the last path segment of the key */
		record.file_name = record.key.substr(record.key.rfind('/') + 1);

	ConfigParser::Finish();
}

void
RecordFileParser::ParseLine2(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "media")) {
		const char *id = line.ExpectValue();
		line.ExpectSymbolAndEol('{');
		SetChild(std::make_unique<MediaBlock>(id));
	} else
		throw FmtRuntimeError("Unknown option '{}'", word);
}

void
RecordFileParser::FinishChild(std::unique_ptr<ConfigParser> &&c)
{
	auto &block = static_cast<MediaBlock &>(*c);
	store.Insert(block.Steal());
}

void
LoadRecordFile(const std::filesystem::path &path, MemoryRecordStore &store)
{
	RecordFileParser parser{store};
	CommentConfigParser comment_parser{parser};
	IncludeConfigParser include_parser{std::filesystem::path{path}, comment_parser};
	ParseConfigFile(path, include_parser);
}

} // namespace Media
