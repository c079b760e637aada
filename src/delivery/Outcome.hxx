// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>

namespace Media {

/**
 * How a delivery request ended.
 */
enum class DeliveryOutcome : uint8_t {
	/**
	 * The response has been sent completely.
	 */
	COMPLETE,

	/**
	 * The headers have been sent, but the body is shorter than
	 * announced because the object ended early or a transfer
	 * error occurred.  The connection must not be reused.
	 */
	INCOMPLETE,

	/**
	 * The client has disconnected.
	 */
	CLIENT_GONE,

	/**
	 * "404 Not Found" has been sent.
	 */
	NOT_FOUND,

	/**
	 * "416 Range Not Satisfiable" has been sent.
	 */
	UNSATISFIABLE,

	/**
	 * "502 Bad Gateway" has been sent.
	 */
	BACKING_STORE_ERROR,

	/**
	 * "500 Internal Server Error" has been sent because the
	 * record store has failed.
	 */
	RECORD_STORE_ERROR,

	/**
	 * "500 Internal Server Error" has been sent.
	 */
	INTERNAL_ERROR,
};

/**
 * May the connection be used for another request after this
 * outcome?
 */
constexpr bool
IsReusable(DeliveryOutcome outcome) noexcept
{
	return outcome != DeliveryOutcome::INCOMPLETE &&
		outcome != DeliveryOutcome::CLIENT_GONE;
}

[[gnu::const]]
const char *
ToString(DeliveryOutcome outcome) noexcept;

} // namespace Media
