// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>

namespace Media {

struct DeliveryResponse;

/**
 * The peer has closed the connection (or it has timed out).  This is
 * an expected condition during a transfer.
 */
class SinkClosedError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The destination of a response.  Methods throw #SinkClosedError if
 * the peer has gone away, and other exceptions on other errors.
 */
class ResponseSink {
public:
	virtual ~ResponseSink() noexcept = default;

	/**
	 * Send the status line and the headers.  This must be called
	 * exactly once, before Write().
	 */
	virtual void Commit(const DeliveryResponse &response) = 0;

	/**
	 * Send a chunk of the body.
	 */
	virtual void Write(std::span<const std::byte> src) = 0;

	/**
	 * The body is complete.
	 */
	virtual void End() = 0;
};

/**
 * Send a response generated by this server, i.e. one whose body (if
 * any) is stored in DeliveryResponse::body.
 *
 * @param head true if this is the response to a HEAD request (the
 * body is omitted)
 */
void
SendResponse(ResponseSink &sink, const DeliveryResponse &response, bool head);

} // namespace Media
