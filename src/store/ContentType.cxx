// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ContentType.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>

using std::string_view_literals::operator""sv;

namespace Media {

struct SuffixType {
	std::string_view suffix, content_type;
};

static constexpr SuffixType suffix_types[] = {
	{"mp4"sv, "video/mp4"sv},
	{"m4v"sv, "video/mp4"sv},
	{"webm"sv, "video/webm"sv},
	{"mov"sv, "video/quicktime"sv},
	{"mkv"sv, "video/x-matroska"sv},
	{"avi"sv, "video/x-msvideo"sv},
	{"mpeg"sv, "video/mpeg"sv},
	{"mpg"sv, "video/mpeg"sv},
	{"ogv"sv, "video/ogg"sv},
	{"jpg"sv, "image/jpeg"sv},
	{"jpeg"sv, "image/jpeg"sv},
	{"png"sv, "image/png"sv},
	{"gif"sv, "image/gif"sv},
	{"webp"sv, "image/webp"sv},
	{"svg"sv, "image/svg+xml"sv},
	{"mp3"sv, "audio/mpeg"sv},
	{"ogg"sv, "audio/ogg"sv},
	{"pdf"sv, "application/pdf"sv},
	{"zip"sv, "application/zip"sv},
	{"txt"sv, "text/plain"sv},
	{"doc"sv, "application/msword"sv},
	{"docx"sv, "application/vnd.openxmlformats-officedocument.wordprocessingml.document"sv},
};

[[gnu::pure]]
static bool
SuffixEquals(std::string_view a, std::string_view b) noexcept
{
	return std::equal(a.begin(), a.end(), b.begin(), b.end(),
			  [](char x, char y){ return ToLowerASCII(x) == y; });
}

std::string_view
GuessContentType(std::string_view path) noexcept
{
	const auto slash = path.rfind('/');
	if (slash != path.npos)
		path = path.substr(slash + 1);

	const auto dot = path.rfind('.');
	if (dot == path.npos)
		return {};

	const auto suffix = path.substr(dot + 1);
	for (const auto &i : suffix_types)
		if (SuffixEquals(suffix, i.suffix))
			return i.content_type;

	return {};
}

} // namespace Media
