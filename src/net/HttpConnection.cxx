// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpConnection.hxx"
#include "BeastSink.hxx"
#include "Route.hxx"
#include "delivery/Handler.hxx"
#include "delivery/Request.hxx"
#include "delivery/Response.hxx"
#include "util/RequestId.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"

#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>

#include <fmt/core.h>

namespace http = boost::beast::http;

using std::string_view_literals::operator""sv;

[[gnu::pure]]
static bool
IsConnectionClosed(const boost::system::error_code &ec) noexcept
{
	return ec == http::error::end_of_stream ||
		ec == boost::asio::error::eof ||
		ec == boost::asio::error::connection_reset ||
		ec == boost::beast::error::timeout;
}

[[gnu::pure]]
static std::string_view
ToStringView(boost::beast::string_view s) noexcept
{
	return {s.data(), s.size()};
}

bool
HttpConnection::HandleRequest(const Request &request)
{
	const std::string request_id = GenerateRequestId();

	const auto correlation_header = ToStringView(request["x-correlation-id"]);
	const std::string_view correlation_id =
		IsValidCorrelationId(correlation_header)
		? correlation_header
		: std::string_view{request_id};

	const auto method = request.method();
	const bool head = method == http::verb::head;
	const auto target = ToStringView(request.target());

	BeastSink sink{
		stream, request.version(),
		request.keep_alive() && !stopping.load(std::memory_order_relaxed),
		head, request_id, correlation_id,
	};

	bool reusable = true;

	if (method != http::verb::get && !head) {
		auto response = Media::MakeErrorResponse(HttpStatus::METHOD_NOT_ALLOWED,
							 "Method Not Allowed"sv);
		response.headers.emplace("allow"sv, "GET, HEAD"sv);
		Media::SendResponse(sink, response, false);
	} else if (auto route = ParseRoute(target);
		   route.type == RouteType::MEDIA) {
		Media::DeliveryRequest r{
			.media_id = std::move(route.media_id),
			.range = std::nullopt,
			.head = head,
			.correlation_id = std::string{correlation_id},
		};

		if (const auto i = request.find(http::field::range);
		    i != request.end())
			r.range.emplace(ToStringView(i->value()));

		reusable = Media::IsReusable(handler.Handle(r, sink));
	} else if (route.type == RouteType::HEALTH) {
		Media::DeliveryResponse response;
		response.MoveTextPlain("ok\n");
		Media::SendResponse(sink, response, head);
	} else {
		Media::SendResponse(sink,
				    Media::MakeErrorResponse(HttpStatus::NOT_FOUND,
							     "Not Found"sv),
				    head);
	}

	logger.Fmt(3, "{} {} {} {} bytes request_id={} correlation_id={}",
		   ToStringView(request.method_string()), target,
		   http_status_to_integer(sink.GetStatus()),
		   sink.GetBytesWritten(), request_id, correlation_id);

	return reusable && sink.IsComplete() && request.keep_alive() &&
		!stopping.load(std::memory_order_relaxed);
}

void
HttpConnection::Run() noexcept
try {
	while (!stopping.load(std::memory_order_relaxed)) {
		http::request_parser<http::empty_body> parser;

		try {
			stream.Run([this, &parser](auto &s, auto &&handler){
				http::async_read(s, buffer, parser,
						 std::forward<decltype(handler)>(handler));
			});
		} catch (const boost::system::system_error &e) {
			if (IsConnectionClosed(e.code()))
				logger.Fmt(4, "Connection closed: {}", e.code().message());
			else
				logger.Fmt(2, "Failed to read request: {}", e.code().message());
			break;
		}

		if (!HandleRequest(parser.get()))
			break;
	}

	stream.ShutdownSend();
} catch (const Media::SinkClosedError &e) {
	logger.Fmt(4, "Connection closed: {}", e.what());
} catch (...) {
	logger.Fmt(1, "Connection failed: {}", std::current_exception());
}
