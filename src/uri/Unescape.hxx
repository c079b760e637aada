// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <string>
#include <string_view>

/**
 * Decode "%XX" escapes.  Malformed escapes and "%00" are rejected.
 *
 * @return the decoded string or std::nullopt on error
 */
std::optional<std::string>
UriUnescape(std::string_view src) noexcept;
