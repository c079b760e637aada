// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

namespace Media {

/**
 * Guess the MIME type from the file name suffix (case-insensitive).
 *
 * @return the MIME type or an empty string if the suffix is not
 * known
 */
[[gnu::pure]]
std::string_view
GuessContentType(std::string_view path) noexcept;

} // namespace Media
