// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

constexpr bool
IsWhitespaceOrNull(const char ch) noexcept
{
	return (unsigned char)ch <= 0x20;
}

constexpr bool
IsWhitespaceNotNull(const char ch) noexcept
{
	return ch > 0 && ch <= 0x20;
}

constexpr bool
IsDigitASCII(char ch) noexcept
{
	return ch >= '0' && ch <= '9';
}

constexpr bool
IsLowerAlphaASCII(char ch) noexcept
{
	return ch >= 'a' && ch <= 'z';
}

constexpr bool
IsUpperAlphaASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z';
}

constexpr bool
IsAlphaNumericASCII(char ch) noexcept
{
	return IsDigitASCII(ch) || IsLowerAlphaASCII(ch) ||
		IsUpperAlphaASCII(ch);
}

/**
 * Is this a printable ASCII character other than space?
 */
constexpr bool
IsGraphASCII(char ch) noexcept
{
	return ch > 0x20 && ch < 0x7f;
}

constexpr char
ToLowerASCII(char ch) noexcept
{
	return IsUpperAlphaASCII(ch)
		? char(ch + ('a' - 'A'))
		: ch;
}
