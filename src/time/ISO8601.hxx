// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <string>

/**
 * Format the given time point as ISO 8601 in UTC with a resolution
 * of one second, e.g. "2009-02-13T23:31:30Z".
 */
std::string
FormatISO8601(std::chrono::system_clock::time_point tp);

/**
 * Parse an ISO 8601 time stamp.  Accepted forms are a date
 * ("2009-02-13") or a date and time of day separated by 'T' or a
 * space, optionally with fractional seconds, followed by an optional
 * "Z" or numeric time zone offset ("+02", "-01:30").  Without a time
 * zone, UTC is assumed.  The space separator and the short offset
 * make this parser accept PostgreSQL's text representation of
 * "timestamp with time zone" values.
 *
 * Throws on error.
 */
std::chrono::system_clock::time_point
ParseISO8601(const char *s);
