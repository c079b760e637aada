// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <optional>
#include <string>

namespace Media {

struct DeliveryRequest {
	/**
	 * The (percent-decoded) media identifier.
	 */
	std::string media_id;

	/**
	 * The raw value of the "Range" request header, if present.
	 */
	std::optional<std::string> range;

	/**
	 * Is this a HEAD request?  If so, only the headers are sent.
	 */
	bool head = false;

	/**
	 * The identifier used in log messages to correlate this
	 * request.
	 */
	std::string correlation_id;
};

} // namespace Media
