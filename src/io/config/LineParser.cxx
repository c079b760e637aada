// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <fmt/core.h>

#include <charconv>
#include <limits>

#include <string.h>

using std::string_view_literals::operator""sv;

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error{fmt::format("Unexpected tokens at end of line: {}"sv, p)};
}

void
LineParser::ExpectSymbol(char symbol)
{
	if (front() != symbol)
		throw Error{fmt::format("'{}' expected"sv, symbol)};

	++p;
	Strip();
}

void
LineParser::ExpectSymbolAndEol(char symbol)
{
	ExpectSymbol(symbol);

	if (!IsEnd())
		throw Error{fmt::format("Unexpected tokens after '{}': {}"sv,
					symbol, p)};
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	const std::size_t length = strlen(word);
	if (strncmp(p, word, length) != 0)
		return false;

	if (p[length] != 0 && !IsWhitespaceNotNull(p[length]))
		return false;

	p += length;
	Strip();
	return true;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		/* garbage after the word; let the caller's ExpectEnd()
		   or ExpectSymbol() complain */
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	char *result = p;
	while (IsUnquotedChar(front()))
		++p;

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *value = p;
	char *end = strchr(p, stop);
	if (end == nullptr)
		return nullptr;

	*end = 0;
	p = end + 1;
	Strip();

	return value;
}

char *
LineParser::NextValue() noexcept
{
	if (IsQuote(front())) {
		const char stop = *p++;
		return NextQuotedValue(stop);
	}

	if (!IsUnquotedChar(front()))
		return nullptr;

	return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return NextValue();

	char *dest = ++p;
	char *const value = dest;

	while (true) {
		char ch = *p++;

		if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		} else if (ch == '\\') {
			ch = *p++;

			switch (ch) {
			case 'r':
				*dest++ = '\r';
				break;

			case 'n':
				*dest++ = '\n';
				break;

			case '\\':
			case '\'':
			case '"':
				*dest++ = ch;
				break;

			default:
				/* unsupported escape character or end of
				   line */
				return nullptr;
			}
		} else if (ch == 0)
			/* end of line without closing quote */
			return nullptr;
		else
			*dest++ = ch;
	}
}

uint_least64_t
LineParser::NextUnsigned64()
{
	const char *string = NextValue();
	if (string == nullptr)
		throw Error("Number expected");

	const char *end = string + strlen(string);
	uint_least64_t value;
	const auto [ptr, ec] = std::from_chars(string, end, value);
	if (ec != std::errc{} || ptr != end)
		throw Error{fmt::format("Not a valid number: '{}'"sv, string)};

	return value;
}

unsigned
LineParser::NextPositiveInteger()
{
	const auto value = NextUnsigned64();
	if (value == 0)
		throw Error("Positive number expected");

	if (value > std::numeric_limits<unsigned>::max())
		throw Error("Number is too large");

	return static_cast<unsigned>(value);
}

const char *
LineParser::ExpectWord()
{
	const char *value = NextWord();
	if (value == nullptr)
		throw Error("Word expected");

	return value;
}

char *
LineParser::ExpectValue()
{
	char *value = NextUnescape();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
