// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Classifier.hxx"
#include "util/StringCompare.hxx"

using std::string_view_literals::operator""sv;

namespace Media {

ContentClass
ClassifyContentType(std::string_view content_type) noexcept
{
	return StringStartsWith(content_type, "video/"sv)
		? ContentClass::VIDEO
		: ContentClass::GENERIC;
}

} // namespace Media
