// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

/**
 * The HTTP status codes generated by this server.
 */
enum class HttpStatus : uint_least16_t {
	/**
	 * Not an actual HTTP status code, but a "magic" value which
	 * means this status has no value.  This can be used as an
	 * initializer.
	 */
	UNDEFINED = 0,

	OK = 200,
	PARTIAL_CONTENT = 206,

	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	REQUESTED_RANGE_NOT_SATISFIABLE = 416,

	INTERNAL_SERVER_ERROR = 500,
	BAD_GATEWAY = 502,
};

constexpr unsigned
http_status_to_integer(HttpStatus status) noexcept
{
	return static_cast<unsigned>(status);
}
