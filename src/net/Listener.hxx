// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/Logger.hxx"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <csignal>
#include <chrono>
#include <mutex>
#include <set>
#include <string_view>

namespace Media { class DeliveryHandler; }
class HttpConnection;

struct ListenerConfig {
	/**
	 * "HOST:PORT"
	 */
	std::string_view address;

	/**
	 * The number of worker threads, i.e. the maximum number of
	 * connections served concurrently.
	 */
	unsigned workers;

	/**
	 * The timeout for each socket read and write.
	 */
	std::chrono::steady_clock::duration idle_timeout;
};

/**
 * Accepts HTTP connections and hands each one to a worker thread.
 * SIGINT and SIGTERM stop accepting and stop all connections from
 * waiting for another request; Run() returns after all in-flight
 * requests have finished.
 */
class Listener {
	boost::asio::io_context ioc{1};
	boost::asio::ip::tcp::acceptor acceptor{ioc};
	boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};

	boost::asio::thread_pool pool;

	Media::DeliveryHandler &handler;

	const std::chrono::steady_clock::duration idle_timeout;

	std::atomic_bool stopping{false};

	/**
	 * Protects #connections.
	 */
	std::mutex connections_mutex;

	/**
	 * The connections currently being served by a worker thread.
	 */
	std::set<HttpConnection *> connections;

	const LLogger logger{"listener"};

public:
	/**
	 * Resolve and bind the listener address.
	 *
	 * Throws on error.
	 */
	Listener(const ListenerConfig &config, Media::DeliveryHandler &_handler);

	~Listener() noexcept;

	Listener(const Listener &) = delete;
	Listener &operator=(const Listener &) = delete;

	boost::asio::ip::tcp::endpoint GetLocalEndpoint() const {
		return acceptor.local_endpoint();
	}

	/**
	 * Serve until a signal is received.
	 */
	void Run();

private:
	void ServeConnection(boost::asio::ip::tcp::socket::native_handle_type fd,
			     const boost::asio::ip::tcp &protocol) noexcept;
	void BeginShutdown() noexcept;

	void Accept() noexcept;
	void OnAccept(const boost::system::error_code &ec,
		      boost::asio::ip::tcp::socket socket) noexcept;
	void OnSignal(const boost::system::error_code &ec, int signo) noexcept;
};
