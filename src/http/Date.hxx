// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Format HTTP dates.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

/**
 * The length of a formatted HTTP date, e.g. "Fri, 13 Feb 2009
 * 23:31:30 GMT", not including the null terminator.
 */
static constexpr std::size_t HTTP_DATE_LENGTH = 29;

/**
 * Format a time stamp as specified by RFC 7231 7.1.1.1 (IMF-fixdate).
 *
 * @param buffer a buffer of at least #HTTP_DATE_LENGTH characters
 * @return the end pointer (not null-terminated)
 */
[[nodiscard]]
char *
http_date_format_r(char *buffer,
		   std::chrono::system_clock::time_point t) noexcept;

std::string
http_date_format(std::chrono::system_clock::time_point t);
