// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Range.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>
#include <cassert>
#include <charconv>
#include <optional>

using std::string_view_literals::operator""sv;

/**
 * Parse a non-empty string of decimal digits.  Unlike strtoull(), no
 * sign and no whitespace is accepted.
 *
 * @return the value or std::nullopt on syntax error or overflow
 */
static std::optional<uint64_t>
ParseDecimal(std::string_view s) noexcept
{
	if (s.empty() || !std::all_of(s.begin(), s.end(), IsDigitASCII))
		return std::nullopt;

	uint64_t value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value);
	if (ec != std::errc{} || ptr != s.data() + s.size())
		return std::nullopt;

	return value;
}

void
HttpRangeRequest::ParseRangeHeader(std::string_view p) noexcept
{
	assert(type == Type::NONE);

	constexpr auto unit = "bytes="sv;
	if (!p.starts_with(unit)) {
		SetInvalid();
		return;
	}

	p.remove_prefix(unit.size());

	const auto dash = p.find('-');
	if (dash == p.npos || p.find('-', dash + 1) != p.npos) {
		/* not exactly two parts; this also rejects multiple
		   ranges, because each one contains a dash */
		SetInvalid();
		return;
	}

	const auto first_string = p.substr(0, dash);
	const auto last_string = p.substr(dash + 1);

	if (first_string.empty()) {
		/* suffix-byte-range-spec */
		const auto suffix_length = ParseDecimal(last_string);
		if (!suffix_length || *suffix_length == 0 || size == 0) {
			SetInvalid();
			return;
		}

		SetValid(size - std::min(*suffix_length, size), size - 1);
		return;
	}

	const auto _first = ParseDecimal(first_string);
	if (!_first || *_first >= size) {
		SetInvalid();
		return;
	}

	uint64_t _last = size - 1;
	if (!last_string.empty()) {
		const auto value = ParseDecimal(last_string);
		if (!value || *value >= size) {
			SetInvalid();
			return;
		}

		_last = *value;
	}

	if (*_first > _last) {
		SetInvalid();
		return;
	}

	SetValid(*_first, _last);
}
