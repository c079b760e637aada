// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Unescape.hxx"
#include "util/CharUtil.hxx"

#include <new>

/**
 * @return the value or -1 if this is not a hex digit
 */
static constexpr int
ParseHexDigit(char ch) noexcept
{
	if (IsDigitASCII(ch))
		return ch - '0';

	ch = ToLowerASCII(ch);
	if (ch >= 'a' && ch <= 'f')
		return ch - 'a' + 0xa;

	return -1;
}

/**
 * Decode the two hex digits following a percent sign.
 *
 * @return the byte value or -1 on error
 */
static constexpr int
ParseEscape(char hi, char lo) noexcept
{
	const int a = ParseHexDigit(hi), b = ParseHexDigit(lo);
	if (a < 0 || b < 0)
		return -1;

	return (a << 4) | b;
}

std::optional<std::string>
UriUnescape(std::string_view src) noexcept
try {
	std::string dest;
	dest.reserve(src.size());

	for (std::size_t i = 0; i < src.size(); ++i) {
		if (src[i] != '%') {
			dest.push_back(src[i]);
			continue;
		}

		if (src.size() - i < 3)
			/* truncated escape at the end of the string */
			return std::nullopt;

		const int value = ParseEscape(src[i + 1], src[i + 2]);
		if (value <= 0)
			/* malformed, or "%00" which would truncate
			   the string in C APIs */
			return std::nullopt;

		dest.push_back(static_cast<char>(value));
		i += 2;
	}

	return dest;
} catch (const std::bad_alloc &) {
	return std::nullopt;
}
