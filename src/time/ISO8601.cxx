// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ISO8601.hxx"
#include "util/CharUtil.hxx"

#include <cassert>
#include <stdexcept>

#include <time.h>

std::string
FormatISO8601(std::chrono::system_clock::time_point tp)
{
	const time_t t = std::chrono::system_clock::to_time_t(tp);
	struct tm tm;
	if (gmtime_r(&t, &tm) == nullptr)
		throw std::runtime_error("gmtime_r() failed");

	char buffer[64];
	strftime(buffer, sizeof(buffer), "%FT%TZ", &tm);
	return buffer;
}

/**
 * Parse exactly two decimal digits.
 */
static unsigned
ParseTwoDigits(const char *s)
{
	if (!IsDigitASCII(s[0]) || !IsDigitASCII(s[1]))
		throw std::runtime_error("Failed to parse time zone offset");

	return (s[0] - '0') * 10 + (s[1] - '0');
}

static std::chrono::system_clock::duration
ParseTimezoneOffset(const char *s)
{
	const unsigned hours = ParseTwoDigits(s);
	if (hours >= 24)
		throw std::runtime_error("Failed to parse time zone offset");

	s += 2;

	unsigned minutes = 0;
	if (*s == ':')
		++s;

	if (*s != 0) {
		minutes = ParseTwoDigits(s);
		if (minutes >= 60)
			throw std::runtime_error("Failed to parse time zone offset");

		s += 2;
	}

	if (*s != 0)
		throw std::runtime_error("Garbage at end of time stamp");

	return std::chrono::hours(hours) + std::chrono::minutes(minutes);
}

std::chrono::system_clock::time_point
ParseISO8601(const char *s)
{
	assert(s != nullptr);

	struct tm tm{};

	/* parse the date */
	const char *end = strptime(s, "%F", &tm);
	if (end == nullptr)
		throw std::runtime_error("Failed to parse date");

	s = end;

	std::chrono::system_clock::duration fraction{};

	/* parse the time of day */
	if (*s == 'T' || *s == ' ') {
		++s;
		end = strptime(s, "%T", &tm);
		if (end == nullptr)
			throw std::runtime_error("Failed to parse time of day");

		s = end;

		if (*s == '.') {
			/* fractional seconds, truncated to microseconds */
			++s;

			std::chrono::microseconds::rep us = 0;
			unsigned n = 0;
			for (; IsDigitASCII(*s); ++s, ++n)
				if (n < 6)
					us = us * 10 + (*s - '0');

			if (n == 0)
				throw std::runtime_error("Failed to parse fractional seconds");

			for (; n < 6; ++n)
				us *= 10;

			fraction = std::chrono::microseconds(us);
		}
	}

	const time_t t = timegm(&tm);
	if (t == (time_t)-1)
		throw std::runtime_error("Time stamp out of range");

	auto result = std::chrono::system_clock::from_time_t(t) + fraction;

	switch (*s) {
	case 0:
		break;

	case 'Z':
		if (s[1] != 0)
			throw std::runtime_error("Garbage at end of time stamp");
		break;

	case '+':
		result -= ParseTimezoneOffset(s + 1);
		break;

	case '-':
		result += ParseTimezoneOffset(s + 1);
		break;

	default:
		throw std::runtime_error("Garbage at end of time stamp");
	}

	return result;
}
