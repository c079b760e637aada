// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Listener.hxx"
#include "HostParser.hxx"
#include "HttpConnection.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"

#include <boost/asio/post.hpp>

#include <fmt/core.h>

#include <exception>
#include <optional>
#include <string>

#include <unistd.h>

using boost::asio::ip::tcp;

static tcp::endpoint
ResolveListenAddress(boost::asio::io_context &ioc, std::string_view address)
try {
	const auto [host, port] = ParseHostAndPort(address);

	tcp::resolver resolver{ioc};
	const auto results = resolver.resolve(std::string{host},
					      std::to_string(port),
					      tcp::resolver::passive|tcp::resolver::numeric_service);
	if (results.empty())
		throw std::runtime_error{"No address"};

	return results.begin()->endpoint();
} catch (...) {
	std::throw_with_nested(std::runtime_error{
			fmt::format("Failed to resolve listener address '{}'",
				    address),
		});
}

Listener::Listener(const ListenerConfig &config,
		   Media::DeliveryHandler &_handler)
	:pool(config.workers), handler(_handler),
	 idle_timeout(config.idle_timeout)
{
	const auto endpoint = ResolveListenAddress(ioc, config.address);

	acceptor.open(endpoint.protocol());
	acceptor.set_option(tcp::acceptor::reuse_address{true});
	acceptor.bind(endpoint);
	acceptor.listen();
}

Listener::~Listener() noexcept
{
	pool.join();
}

void
Listener::Accept() noexcept
{
	acceptor.async_accept([this](const boost::system::error_code &ec,
				     tcp::socket socket){
		OnAccept(ec, std::move(socket));
	});
}

void
Listener::OnAccept(const boost::system::error_code &ec,
		   tcp::socket socket) noexcept
{
	if (ec == boost::asio::error::operation_aborted)
		/* the acceptor was closed by OnSignal() */
		return;

	if (ec) {
		logger.Fmt(2, "Failed to accept connection: {}", ec.message());
		Accept();
		return;
	}

	boost::system::error_code ec2;
	const auto protocol = socket.local_endpoint(ec2).protocol();
	tcp::socket::native_handle_type fd = -1;
	if (!ec2)
		fd = socket.release(ec2);

	if (ec2) {
		logger.Fmt(2, "Failed to take over connection: {}",
			   ec2.message());
		Accept();
		return;
	}

	boost::asio::post(pool, [this, fd, protocol]{
		ServeConnection(fd, protocol);
	});

	Accept();
}

void
Listener::ServeConnection(tcp::socket::native_handle_type fd,
			  const tcp &protocol) noexcept
{
	std::optional<HttpConnection> connection;

	try {
		connection.emplace(fd, protocol, idle_timeout,
				   handler, stopping);
	} catch (...) {
		/* the socket was not adopted */
		::close(fd);

		logger.Fmt(1, "Failed to set up connection: {}",
			   std::current_exception());
		return;
	}

	{
		const std::scoped_lock lock{connections_mutex};
		connections.insert(&*connection);
	}

	connection->Run();

	const std::scoped_lock lock{connections_mutex};
	connections.erase(&*connection);
}

void
Listener::OnSignal(const boost::system::error_code &ec, int signo) noexcept
{
	if (ec)
		return;

	logger.Fmt(2, "Received signal {}, shutting down", signo);

	BeginShutdown();
}

void
Listener::BeginShutdown() noexcept
{
	stopping = true;

	boost::system::error_code ignored;
	acceptor.close(ignored);
	signals.cancel(ignored);

	/* wake up connections waiting for the next request */
	const std::scoped_lock lock{connections_mutex};
	for (auto *connection : connections)
		connection->Stop();
}

void
Listener::Run()
{
	signals.async_wait([this](const boost::system::error_code &ec,
				  int signo){
		OnSignal(ec, signo);
	});

	Accept();

	logger.Fmt(3, "Listening on {}:{}",
		   acceptor.local_endpoint().address().to_string(),
		   acceptor.local_endpoint().port());

	ioc.run();

	/* wait for in-flight connections */
	pool.join();
}
