// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

namespace Media {

enum class ContentClass : uint8_t {
	/**
	 * Delivered as a download ("attachment"); "Range" requests
	 * are not honoured.
	 */
	GENERIC,

	/**
	 * Delivered for inline playback; "Range" requests are
	 * honoured and the response may be cached by the client.
	 */
	VIDEO,
};

/**
 * Classify an object by its MIME type.  Only the literal prefix
 * "video/" selects #ContentClass::VIDEO; parameters and case are not
 * interpreted.
 */
[[gnu::pure]]
ContentClass
ClassifyContentType(std::string_view content_type) noexcept;

} // namespace Media
