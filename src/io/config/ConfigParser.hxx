// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>
#include <memory>
#include <utility>

class FileLineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Give this object a chance to handle the line before
	 * ParseLine() gets called.
	 *
	 * @return true if the line has been handled
	 */
	virtual bool PreParseLine(FileLineParser &line);

	virtual void ParseLine(FileLineParser &line) = 0;

	/**
	 * The end of the input has been reached.  This is the last
	 * chance to check for missing settings.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which can dynamically forward method calls to a
 * nested #ConfigParser instance, i.e. a block delimited by "{" and
 * "}".
 */
class NestedConfigParser : public ConfigParser {
	std::unique_ptr<ConfigParser> child;

public:
	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) final;
	void Finish() override;

protected:
	void SetChild(std::unique_ptr<ConfigParser> &&_child) noexcept;
	virtual void ParseLine2(FileLineParser &line) = 0;

	/**
	 * This virtual method gets called after the given child
	 * parser has finished, before it gets destructed.
	 */
	virtual void FinishChild(std::unique_ptr<ConfigParser> &&) {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

/**
 * A #ConfigParser which can "include" other files with the
 * "@include" and "@include_optional" directives.
 */
class IncludeConfigParser final : public ConfigParser {
	const std::filesystem::path path;

	ConfigParser &child;

	/**
	 * Does our Finish() override call child.Finish()?  Included
	 * files must not finish the child, only the top-level file
	 * does.
	 */
	const bool finish_child;

public:
	IncludeConfigParser(std::filesystem::path &&_path,
			    ConfigParser &_child,
			    bool _finish_child=true) noexcept
		:path(std::move(_path)), child(_child),
		 finish_child(_finish_child) {}

	const std::filesystem::path &GetPath() const noexcept {
		return path;
	}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(FileLineParser &line) override;
	void ParseLine(FileLineParser &line) override;
	void Finish() override;

private:
	void IncludePath(std::filesystem::path &&p, bool optional);
};

/**
 * Parse a configuration file line by line, and pass each line to the
 * given #ConfigParser.  Errors are wrapped in an exception which
 * names the file and the line number.
 *
 * Throws on error.
 */
void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser);
