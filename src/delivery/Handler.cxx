// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Handler.hxx"
#include "Classifier.hxx"
#include "Executor.hxx"
#include "Plan.hxx"
#include "Request.hxx"
#include "Response.hxx"
#include "Sink.hxx"
#include "store/BlobStore.hxx"
#include "store/Error.hxx"
#include "store/RecordStore.hxx"
#include "http/Range.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"

#include <optional>

using std::string_view_literals::operator""sv;

namespace Media {

const char *
ToString(DeliveryOutcome outcome) noexcept
{
	switch (outcome) {
	case DeliveryOutcome::COMPLETE:
		return "complete";

	case DeliveryOutcome::INCOMPLETE:
		return "incomplete";

	case DeliveryOutcome::CLIENT_GONE:
		return "client gone";

	case DeliveryOutcome::NOT_FOUND:
		return "not found";

	case DeliveryOutcome::UNSATISFIABLE:
		return "unsatisfiable";

	case DeliveryOutcome::BACKING_STORE_ERROR:
		return "backing store error";

	case DeliveryOutcome::RECORD_STORE_ERROR:
		return "record store error";

	case DeliveryOutcome::INTERNAL_ERROR:
		return "internal error";
	}

	return "unknown";
}

static constexpr DeliveryOutcome
ToOutcome(TransferStatus status) noexcept
{
	switch (status) {
	case TransferStatus::COMPLETE:
		return DeliveryOutcome::COMPLETE;

	case TransferStatus::CLIENT_GONE:
		return DeliveryOutcome::CLIENT_GONE;

	case TransferStatus::INCOMPLETE:
	case TransferStatus::FAILED:
		break;
	}

	return DeliveryOutcome::INCOMPLETE;
}

[[gnu::pure]]
static std::string_view
SelectContentType(const Record &record,
		  const BlobMetadata &metadata) noexcept
{
	if (!record.content_type.empty())
		return record.content_type;

	if (!metadata.content_type.empty())
		return metadata.content_type;

	return "application/octet-stream"sv;
}

void
DeliveryHandler::SendSimple(ResponseSink &sink,
			    const DeliveryResponse &response, bool head,
			    const ChildLogger &request_logger) noexcept
try {
	SendResponse(sink, response, head);
} catch (const SinkClosedError &e) {
	request_logger.Fmt(4, "Client disconnected: {}", e.what());
} catch (...) {
	request_logger.Fmt(1, "Failed to send response: {}",
			   std::current_exception());
}

void
DeliveryHandler::SendError(ResponseSink &sink, HttpStatus status,
			   std::string_view message, bool head,
			   const ChildLogger &request_logger) noexcept
try {
	SendSimple(sink, MakeErrorResponse(status, message), head,
		   request_logger);
} catch (...) {
	request_logger.Fmt(1, "Failed to build error response: {}",
			   std::current_exception());
}

inline DeliveryOutcome
DeliveryHandler::Handle2(const DeliveryRequest &request, ResponseSink &sink,
			 const ChildLogger &request_logger)
{
	const auto deadline = MakeDeadline(config.storage_timeout);
	const std::string_view id = request.media_id;

	std::optional<Record> record;
	try {
		record = records.Lookup(id, deadline);
	} catch (...) {
		request_logger.Fmt(1, "Failed to look up media '{}': {}",
				   id, std::current_exception());
		SendError(sink, HttpStatus::INTERNAL_SERVER_ERROR,
			  "Internal Server Error"sv, request.head,
			  request_logger);
		return DeliveryOutcome::RECORD_STORE_ERROR;
	}

	if (!record) {
		request_logger.Fmt(3, "Media '{}' not found", id);
		SendError(sink, HttpStatus::NOT_FOUND, "Not Found"sv,
			  request.head, request_logger);
		return DeliveryOutcome::NOT_FOUND;
	}

	std::optional<BlobMetadata> metadata;
	try {
		metadata = blobs.GetMetadata(record->key, deadline);
	} catch (...) {
		request_logger.Fmt(1, "Backing store failed for media '{}' (key '{}'): {}",
				   id, record->key, std::current_exception());
		SendError(sink, HttpStatus::BAD_GATEWAY, "Bad Gateway"sv,
			  request.head, request_logger);
		return DeliveryOutcome::BACKING_STORE_ERROR;
	}

	if (metadata->size != record->size)
		request_logger.Fmt(2, "Size mismatch for media '{}': record says {}, backing store says {}",
				   id, record->size, metadata->size);

	const auto content_type = SelectContentType(*record, *metadata);
	const auto content_class = ClassifyContentType(content_type);

	HttpRangeRequest range{metadata->size};
	if (content_class == ContentClass::VIDEO && request.range) {
		range.ParseRangeHeader(*request.range);
		if (range.IsInvalid()) {
			request_logger.Fmt(3, "Unsatisfiable range '{}' for media '{}' (size {})",
					   *request.range, id, metadata->size);
			SendSimple(sink, MakeUnsatisfiableResponse(),
				   request.head, request_logger);
			return DeliveryOutcome::UNSATISFIABLE;
		}
	}

	const auto plan = MakeDeliveryPlan(metadata->size, content_class,
					   range);

	const auto response =
		MakeContentResponse(plan,
				    {
					    .content_type = content_type,
					    .file_name = record->file_name,
					    .last_modified = record->created,
				    },
				    config.cache_max_age);

	if (request.head) {
		SendSimple(sink, response, true, request_logger);
		return DeliveryOutcome::COMPLETE;
	}

	StreamExecutor executor{blobs};

	TransferResult result;
	try {
		result = executor.Execute(record->key, plan, response, sink,
					  deadline, request_logger);
	} catch (const SkipError &) {
		request_logger.Fmt(1, "Failed to seek media '{}' to offset {}: {}",
				   id, plan.start, std::current_exception());
		SendError(sink, HttpStatus::INTERNAL_SERVER_ERROR,
			  "Internal Server Error"sv, false, request_logger);
		return DeliveryOutcome::INTERNAL_ERROR;
	} catch (const BackingStoreError &) {
		request_logger.Fmt(1, "Failed to open media '{}' (key '{}'): {}",
				   id, record->key, std::current_exception());
		SendError(sink, HttpStatus::BAD_GATEWAY, "Bad Gateway"sv,
			  false, request_logger);
		return DeliveryOutcome::BACKING_STORE_ERROR;
	}

	const auto outcome = ToOutcome(result.status);
	request_logger.Fmt(3, "Sent {} of {} bytes of media '{}' (range {}-{}/{}, {})",
			   result.written, plan.content_length, id,
			   plan.start, plan.end, plan.size, ToString(outcome));
	return outcome;
}

DeliveryOutcome
DeliveryHandler::Handle(const DeliveryRequest &request,
			ResponseSink &sink) noexcept
{
	const ChildLogger request_logger{logger, request.correlation_id};

	try {
		return Handle2(request, sink, request_logger);
	} catch (...) {
		request_logger.Fmt(1, "Failed to deliver media '{}': {}",
				   request.media_id, std::current_exception());
		SendError(sink, HttpStatus::INTERNAL_SERVER_ERROR,
			  "Internal Server Error"sv, request.head,
			  request_logger);
		return DeliveryOutcome::INTERNAL_ERROR;
	}
}

} // namespace Media
