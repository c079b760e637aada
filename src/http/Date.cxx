// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Date.hxx"

#include <cstddef>

#include <time.h>

static constexpr char wdays[][4] = {
	"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat",
};

static constexpr char months[][4] = {
	"Jan", "Feb", "Mar", "Apr", "May", "Jun",
	"Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};

static constexpr char *
FormatDigits(char *dest, unsigned value, unsigned n_digits) noexcept
{
	for (unsigned i = n_digits; i-- > 0;) {
		dest[i] = '0' + (value % 10);
		value /= 10;
	}

	return dest + n_digits;
}

static char *
Append(char *dest, const char *src) noexcept
{
	while (*src != 0)
		*dest++ = *src++;
	return dest;
}

char *
http_date_format_r(char *buffer,
		   std::chrono::system_clock::time_point t) noexcept
{
	const time_t tt = std::chrono::system_clock::to_time_t(t);
	struct tm tm{};
	gmtime_r(&tt, &tm);

	char *p = buffer;
	p = Append(p, wdays[tm.tm_wday % 7]);
	p = Append(p, ", ");
	p = FormatDigits(p, tm.tm_mday, 2);
	*p++ = ' ';
	p = Append(p, months[tm.tm_mon % 12]);
	*p++ = ' ';
	p = FormatDigits(p, tm.tm_year + 1900, 4);
	*p++ = ' ';
	p = FormatDigits(p, tm.tm_hour, 2);
	*p++ = ':';
	p = FormatDigits(p, tm.tm_min, 2);
	*p++ = ':';
	p = FormatDigits(p, tm.tm_sec, 2);
	p = Append(p, " GMT");
	return p;
}

std::string
http_date_format(std::chrono::system_clock::time_point t)
{
	char buffer[HTTP_DATE_LENGTH + 1];
	const char *end = http_date_format_r(buffer, t);
	return std::string(buffer, std::size_t(end - buffer));
}
