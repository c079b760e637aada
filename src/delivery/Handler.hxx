// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Outcome.hxx"
#include "io/Logger.hxx"
#include "http/Status.hxx"

#include <chrono>
#include <string_view>

namespace Media {

class RecordStore;
class BlobStore;
class ResponseSink;
struct DeliveryRequest;
struct DeliveryResponse;

struct DeliveryConfig {
	/**
	 * The "max-age" directive sent with video responses.
	 */
	std::chrono::seconds cache_max_age{3600};

	/**
	 * The time limit for all record store and backing store
	 * calls of one request.
	 */
	std::chrono::steady_clock::duration storage_timeout = std::chrono::seconds{10};
};

/**
 * Serves one media request: resolves the record, fetches the object
 * metadata, evaluates the "Range" header and streams the selected
 * bytes to the #ResponseSink.
 *
 * This class holds no per-request state; Handle() may be called
 * concurrently from multiple threads.
 */
class DeliveryHandler {
	RecordStore &records;
	BlobStore &blobs;

	const DeliveryConfig config;

	const LLogger logger{"delivery"};

public:
	DeliveryHandler(RecordStore &_records, BlobStore &_blobs,
			const DeliveryConfig &_config) noexcept
		:records(_records), blobs(_blobs), config(_config) {}

	/**
	 * Handle the request and send a response to the sink.  All
	 * errors are handled (i.e. reported to the client and/or
	 * logged) by this method.
	 */
	DeliveryOutcome Handle(const DeliveryRequest &request,
			       ResponseSink &sink) noexcept;

private:
	DeliveryOutcome Handle2(const DeliveryRequest &request,
				ResponseSink &sink,
				const ChildLogger &request_logger);

	/**
	 * Send a response generated by this server (i.e. without an
	 * object body).
	 */
	static void SendSimple(ResponseSink &sink,
			       const DeliveryResponse &response, bool head,
			       const ChildLogger &request_logger) noexcept;

	static void SendError(ResponseSink &sink, HttpStatus status,
			      std::string_view message, bool head,
			      const ChildLogger &request_logger) noexcept;
};

} // namespace Media
