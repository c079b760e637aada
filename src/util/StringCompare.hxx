// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

/**
 * Does the string begin with the given prefix?
 */
[[gnu::pure]]
static constexpr bool
StringStartsWith(std::string_view haystack, std::string_view needle) noexcept
{
	return haystack.starts_with(needle);
}

/**
 * Check if the given string begins with the given prefix, and if
 * so, remove it.
 *
 * @return true if the prefix was found and removed
 */
static constexpr bool
SkipPrefix(std::string_view &haystack, std::string_view needle) noexcept
{
	bool match = haystack.starts_with(needle);
	if (match)
		haystack.remove_prefix(needle.size());
	return match;
}
