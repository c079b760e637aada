// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"
#include "system/Error.hxx"

#include <fmt/core.h>

#include <cassert>
#include <exception>

#include <stdio.h>
#include <stdlib.h>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
NestedConfigParser::PreParseLine(FileLineParser &line)
{
	if (child) {
		if (child->PreParseLine(line))
			return true;

		if (line.SkipSymbol('}')) {
			line.ExpectEnd();
			child->Finish();
			FinishChild(std::move(child));
			child.reset();
			return true;
		}
	}

	return ConfigParser::PreParseLine(line);
}

void
NestedConfigParser::ParseLine(FileLineParser &line)
{
	if (child)
		child->ParseLine(line);
	else
		ParseLine2(line);
}

void
NestedConfigParser::Finish()
{
	if (child)
		throw LineParser::Error("Block not closed at end of file");

	ConfigParser::Finish();
}

void
NestedConfigParser::SetChild(std::unique_ptr<ConfigParser> &&_child) noexcept
{
	assert(!child);

	child = std::move(_child);
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return child.PreParseLine(line);
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
		IncludePath(line.ExpectPathAndEnd(), false);
	} else if (line.SkipWord("@include_optional")) {
		IncludePath(line.ExpectPathAndEnd(), true);
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	if (finish_child)
		child.Finish();
}

inline void
IncludeConfigParser::IncludePath(std::filesystem::path &&p, bool optional)
{
	if (optional && !std::filesystem::exists(p))
		return;

	IncludeConfigParser sub(std::move(p), child, false);
	ParseConfigFile(sub.GetPath(), sub);
}

namespace {

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		fclose(file);
	}
};

struct LineBuffer {
	char *data = nullptr;
	std::size_t capacity = 0;

	~LineBuffer() noexcept {
		free(data);
	}
};

} // anonymous namespace

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	const std::unique_ptr<FILE, FileCloser> file{fopen(path.c_str(), "r")};
	if (!file)
		throw FmtErrno("Failed to open {}", path.native());

	LineBuffer buffer;

	unsigned i = 1;
	while (getline(&buffer.data, &buffer.capacity, file.get()) >= 0) {
		FileLineParser line_parser(path, buffer.data);

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		++i;
	}

	if (ferror(file.get()))
		throw FmtErrno("Failed to read {}", path.native());

	parser.Finish();
}
