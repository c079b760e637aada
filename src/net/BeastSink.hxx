// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "delivery/Sink.hxx"
#include "http/Status.hxx"

#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/serializer.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

class SyncStream;

/**
 * A #Media::ResponseSink which serializes the response with Beast to
 * a #SyncStream.  The body is streamed with a
 * boost::beast::http::buffer_body; no chunk is buffered beyond the
 * duration of one Write() call.
 */
class BeastSink final : public Media::ResponseSink {
	SyncStream &stream;

	const unsigned version;
	const bool keep_alive;
	const bool head;

	const std::string_view request_id, correlation_id;

	using Response = boost::beast::http::response<boost::beast::http::buffer_body>;
	using Serializer = boost::beast::http::response_serializer<boost::beast::http::buffer_body>;

	Response response;
	std::optional<Serializer> serializer;

	HttpStatus status = HttpStatus::UNDEFINED;

	/**
	 * The announced body length.
	 */
	uint64_t content_length = 0;

	uint64_t written = 0;

	bool ended = false;

public:
	BeastSink(SyncStream &_stream, unsigned _version,
		  bool _keep_alive, bool _head,
		  std::string_view _request_id,
		  std::string_view _correlation_id) noexcept
		:stream(_stream), version(_version),
		 keep_alive(_keep_alive), head(_head),
		 request_id(_request_id), correlation_id(_correlation_id) {}

	BeastSink(const BeastSink &) = delete;
	BeastSink &operator=(const BeastSink &) = delete;

	bool IsCommitted() const noexcept {
		return status != HttpStatus::UNDEFINED;
	}

	HttpStatus GetStatus() const noexcept {
		return status;
	}

	uint64_t GetBytesWritten() const noexcept {
		return written;
	}

	/**
	 * Has the response been sent completely, i.e. may the
	 * connection be reused?
	 */
	bool IsComplete() const noexcept {
		return ended && (head || written == content_length);
	}

	/* virtual methods from class Media::ResponseSink */
	void Commit(const Media::DeliveryResponse &r) override;
	void Write(std::span<const std::byte> src) override;
	void End() override;

private:
	/**
	 * Run a serializer write operation, translating errors which
	 * mean that the peer is gone to #Media::SinkClosedError.
	 */
	template<typename Initiate>
	void Run(Initiate &&initiate);
};
