// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "net/SyncStream.hxx"
#include "system/Error.hxx"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <array>
#include <chrono>
#include <string>
#include <string_view>

#include <sys/socket.h>

/**
 * A connected pair of stream sockets.  Both descriptors are meant to
 * be adopted by a #SyncStream.
 */
struct SocketPair {
	int server, client;

	SocketPair() {
		int fds[2];
		if (socketpair(AF_LOCAL, SOCK_STREAM|SOCK_CLOEXEC, 0, fds) < 0)
			throw MakeErrno("socketpair() failed");

		server = fds[0];
		client = fds[1];
	}
};

template<typename Message, typename Name>
std::string
GetHeader(const Message &message, Name name)
{
	const auto value = message[name];
	return {value.data(), value.size()};
}

/**
 * The client side of a #SocketPair: sends requests and parses
 * responses with Beast.
 */
class HttpTestClient {
	SyncStream stream;
	boost::beast::flat_buffer buffer;

public:
	using Response = boost::beast::http::response<boost::beast::http::string_body>;

	explicit HttpTestClient(int fd)
		:stream(fd, boost::asio::ip::tcp::v4(),
			std::chrono::seconds{10}) {}

	void Send(boost::beast::http::verb method, std::string_view target,
		  std::string_view range={},
		  std::string_view correlation_id={}) {
		boost::beast::http::request<boost::beast::http::empty_body> request{
			method,
			boost::beast::string_view{target.data(), target.size()},
			11,
		};
		request.set(boost::beast::http::field::host, "localhost");
		if (!range.empty())
			request.set(boost::beast::http::field::range,
				    boost::beast::string_view{range.data(), range.size()});
		if (!correlation_id.empty())
			request.set("x-correlation-id",
				    boost::beast::string_view{correlation_id.data(),
							      correlation_id.size()});

		stream.Run([&request](auto &s, auto &&handler){
			boost::beast::http::async_write(s, request,
							std::forward<decltype(handler)>(handler));
		});
	}

	/**
	 * Receive one response.
	 *
	 * @param head true if the request was HEAD (the response has
	 * no body, even though "Content-Length" may be non-zero)
	 */
	Response Receive(bool head=false) {
		boost::beast::http::response_parser<boost::beast::http::string_body> parser;
		parser.skip(head);

		stream.Run([this, &parser](auto &s, auto &&handler){
			boost::beast::http::async_read(s, buffer, parser,
						       std::forward<decltype(handler)>(handler));
		});

		return parser.release();
	}

	/**
	 * Receive everything until the server closes the connection,
	 * including data which is already buffered.
	 */
	std::string ReceiveAll() {
		std::string result{static_cast<const char *>(buffer.data().data()),
				   buffer.size()};
		buffer.clear();

		std::array<char, 4096> chunk;
		while (true) {
			try {
				const std::size_t n = stream.Run([&chunk](auto &s, auto &&handler){
					s.async_read_some(boost::asio::buffer(chunk),
							  std::forward<decltype(handler)>(handler));
				});
				result.append(chunk.data(), n);
			} catch (const boost::system::system_error &e) {
				if (e.code() == boost::asio::error::eof)
					return result;
				throw;
			}
		}
	}

	/**
	 * Has the server closed the connection (and sent nothing
	 * else)?
	 */
	bool IsClosed() {
		return buffer.size() == 0 && ReceiveAll().empty();
	}
};
