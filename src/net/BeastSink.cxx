// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BeastSink.hxx"
#include "SyncStream.hxx"
#include "delivery/Response.hxx"

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/write.hpp>

#include <cassert>

namespace http = boost::beast::http;

[[gnu::pure]]
static bool
IsPeerGone(const boost::system::error_code &ec) noexcept
{
	return ec == boost::asio::error::broken_pipe ||
		ec == boost::asio::error::connection_reset ||
		ec == boost::asio::error::connection_aborted ||
		ec == boost::asio::error::not_connected ||
		ec == boost::asio::error::eof ||
		ec == boost::beast::error::timeout;
}

[[gnu::pure]]
static boost::beast::string_view
ToBeast(std::string_view s) noexcept
{
	return {s.data(), s.size()};
}

template<typename Initiate>
inline void
BeastSink::Run(Initiate &&initiate)
{
	try {
		stream.Run(std::forward<Initiate>(initiate));
	} catch (const boost::system::system_error &e) {
		/* buffer_body reports that it has consumed the buffer
		   and wants more */
		if (e.code() == http::error::need_buffer)
			return;

		if (IsPeerGone(e.code()))
			throw Media::SinkClosedError{e.code().message()};

		throw;
	}
}

void
BeastSink::Commit(const Media::DeliveryResponse &r)
{
	assert(!IsCommitted());

	status = r.status;
	content_length = r.content_length;

	response.version(version);
	response.result(http_status_to_integer(r.status));

	for (const auto &[name, value] : r.headers)
		response.insert(ToBeast(name), ToBeast(value));

	response.set("x-request-id", ToBeast(request_id));
	response.set("x-correlation-id", ToBeast(correlation_id));
	response.content_length(r.content_length);
	response.keep_alive(keep_alive);

	response.body().data = nullptr;
	response.body().more = !head;

	serializer.emplace(response);

	Run([this](auto &s, auto &&handler){
		http::async_write_header(s, *serializer,
					 std::forward<decltype(handler)>(handler));
	});
}

void
BeastSink::Write(std::span<const std::byte> src)
{
	assert(IsCommitted());
	assert(!ended);
	assert(!head);

	if (src.empty())
		return;

	response.body().data = const_cast<std::byte *>(src.data());
	response.body().size = src.size();
	response.body().more = true;

	Run([this](auto &s, auto &&handler){
		http::async_write(s, *serializer,
				  std::forward<decltype(handler)>(handler));
	});

	written += src.size();
}

void
BeastSink::End()
{
	assert(IsCommitted());
	assert(!ended);

	if (!head) {
		response.body().data = nullptr;
		response.body().size = 0;
		response.body().more = false;

		Run([this](auto &s, auto &&handler){
			http::async_write(s, *serializer,
					  std::forward<decltype(handler)>(handler));
		});
	}

	ended = true;
}
