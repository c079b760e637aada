// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

enum class RouteType : uint8_t {
	/**
	 * The path does not refer to anything served here.
	 */
	UNKNOWN,

	/**
	 * "/health"
	 */
	HEALTH,

	/**
	 * "/media/ID"; see Route::media_id.
	 */
	MEDIA,
};

struct Route {
	RouteType type = RouteType::UNKNOWN;

	/**
	 * The percent-decoded media identifier (only for
	 * #RouteType::MEDIA).
	 */
	std::string media_id;
};

/**
 * Map a request target to a #Route.  The query string is ignored.
 * The media identifier must be exactly one non-empty path segment.
 */
Route
ParseRoute(std::string_view target);
