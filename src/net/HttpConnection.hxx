// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "SyncStream.hxx"
#include "io/Logger.hxx"

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/message.hpp>

#include <atomic>

namespace Media { class DeliveryHandler; }

/**
 * One HTTP/1.1 connection.  Run() reads and handles requests
 * sequentially (with keep-alive) on the calling thread until the
 * client closes the connection, an error occurs or the server shuts
 * down.
 */
class HttpConnection {
	SyncStream stream;
	boost::beast::flat_buffer buffer;

	Media::DeliveryHandler &handler;

	/**
	 * Set by the listener on shutdown; the connection will be
	 * closed after the current request.  See Stop().
	 */
	const std::atomic_bool &stopping;

	const LLogger logger{"http"};

public:
	HttpConnection(boost::asio::ip::tcp::socket::native_handle_type fd,
		       const boost::asio::ip::tcp &protocol,
		       std::chrono::steady_clock::duration idle_timeout,
		       Media::DeliveryHandler &_handler,
		       const std::atomic_bool &_stopping)
		:stream(fd, protocol, idle_timeout),
		 handler(_handler), stopping(_stopping) {}

	void Run() noexcept;

	/**
	 * Stop waiting for the next request.  The request currently
	 * being handled (if any) is finished, and then Run() returns.
	 * Must be called after #stopping has been set; may be called
	 * from any thread.
	 */
	void Stop() noexcept {
		stream.ShutdownReceive();
	}

private:
	using Request = boost::beast::http::request<boost::beast::http::empty_body>;

	/**
	 * @return true if the connection may be reused
	 */
	bool HandleRequest(const Request &request);
};
