// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileLineParser.hxx"

std::filesystem::path
FileLineParser::ExpectPath()
{
	const char *value = NextUnescape();
	if (value == nullptr || *value == 0)
		throw Error("Quoted path expected");

	std::filesystem::path p{value};
	if (p.is_relative() && !base_path.empty())
		p = base_path.parent_path() / p;

	return p;
}
