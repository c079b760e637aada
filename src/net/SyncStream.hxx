// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <cstddef>
#include <utility>

#include <sys/socket.h>

/**
 * A TCP connection with blocking I/O where each operation is bounded
 * by a timeout.  Internally, every operation is an asynchronous
 * Beast/Asio operation on a private #io_context which is run until
 * the operation completes; the calling thread blocks meanwhile.
 */
class SyncStream {
	boost::asio::io_context ioc{1};
	boost::beast::tcp_stream stream{ioc};

	const std::chrono::steady_clock::duration timeout;

	const boost::asio::ip::tcp::socket::native_handle_type fd;

public:
	/**
	 * Throws on error.
	 *
	 * @param _fd a connected socket; ownership is transferred to
	 * this object
	 */
	SyncStream(boost::asio::ip::tcp::socket::native_handle_type _fd,
		   const boost::asio::ip::tcp &protocol,
		   std::chrono::steady_clock::duration _timeout)
		:timeout(_timeout), fd(_fd)
	{
		stream.socket().assign(protocol, fd);
	}

	SyncStream(const SyncStream &) = delete;
	SyncStream &operator=(const SyncStream &) = delete;

	/**
	 * Run one asynchronous operation and wait for its
	 * completion.  The operation is started by calling
	 * initiate(stream, handler).
	 *
	 * Throws boost::system::system_error on error (including
	 * boost::beast::error::timeout).
	 */
	template<typename Initiate>
	std::size_t Run(Initiate &&initiate) {
		boost::system::error_code result;
		std::size_t nbytes = 0;

		stream.expires_after(timeout);
		std::forward<Initiate>(initiate)(stream,
						 [&result, &nbytes](const boost::system::error_code &ec,
								    std::size_t n){
							 result = ec;
							 nbytes = n;
						 });

		ioc.restart();
		ioc.run();

		if (result)
			throw boost::system::system_error{result};

		return nbytes;
	}

	/**
	 * Signal the end of the response stream to the peer.
	 */
	void ShutdownSend() noexcept {
		boost::system::error_code ec;
		stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send,
					 ec);
	}

	/**
	 * Wake up a pending read: shut down the receiving side of
	 * the socket.  May be called from any thread.
	 */
	void ShutdownReceive() noexcept {
		::shutdown(fd, SHUT_RD);
	}
};
