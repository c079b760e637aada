// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "LineParser.hxx"

#include <filesystem>

/**
 * A #LineParser which knows the path of the file being parsed, so
 * relative paths in the file can be resolved against it.
 */
class FileLineParser : public LineParser {
	const std::filesystem::path &base_path;

public:
	FileLineParser(const std::filesystem::path &_base_path, char *_p) noexcept
		:LineParser(_p), base_path(_base_path) {}

	/**
	 * Parse a (quoted) path.  A relative path is interpreted
	 * relative to the directory containing the file being parsed.
	 */
	std::filesystem::path ExpectPath();

	std::filesystem::path ExpectPathAndEnd() {
		auto value = ExpectPath();
		ExpectEnd();
		return value;
	}
};
