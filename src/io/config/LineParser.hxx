// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/StringStrip.hxx"
#include "util/CharUtil.hxx"

#include <chrono>
#include <cstdint>
#include <stdexcept>

class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept
		:p(StripLeft(_p))
	{
		StripRight(p);
	}

	void Strip() noexcept {
		p = StripLeft(p);
	}

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectEnd();

	void ExpectSymbol(char symbol);

	void ExpectSymbolAndEol(char symbol);

	bool SkipSymbol(char symbol) noexcept {
		bool found = front() == symbol;
		if (found)
			++p;
		return found;
	}

	/**
	 * If the next word matches the given parameter, then skip it and
	 * return true.  If not, the method returns false, leaving the
	 * object unmodified.
	 */
	bool SkipWord(const char *word) noexcept;

	const char *NextWord() noexcept;
	char *NextValue() noexcept;

	/**
	 * Like NextValue(), but quoted values may contain backslash
	 * escapes.
	 */
	char *NextUnescape() noexcept;

	unsigned NextPositiveInteger();

	/**
	 * Parse an unsigned 64 bit integer (zero allowed).
	 */
	uint_least64_t NextUnsigned64();

	/**
	 * Parse a positive number of seconds.
	 */
	std::chrono::seconds NextPositiveSeconds() {
		return std::chrono::seconds{NextPositiveInteger()};
	}

	const char *ExpectWord();

	/**
	 * Expect a non-empty value.
	 */
	char *ExpectValue();

	/**
	 * Expect a non-empty value and end-of-line.
	 */
	char *ExpectValueAndEnd();

	static constexpr bool IsWordChar(char ch) noexcept {
		return IsAlphaNumericASCII(ch) || ch == '_';
	}

private:
	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	/**
	 * Characters allowed in unquoted values; this includes
	 * everything needed for object keys, numbers, dates and
	 * "HOST:PORT".
	 */
	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':' ||
			ch == '/' || ch == '+';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
