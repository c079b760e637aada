// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Executor.hxx"
#include "Plan.hxx"
#include "Response.hxx"
#include "Sink.hxx"
#include "store/BlobStore.hxx"
#include "io/Logger.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <memory>

namespace Media {

inline void
StreamExecutor::SkipTo(BlobReader &reader, uint64_t offset)
{
	uint64_t skipped;

	try {
		skipped = reader.Skip(offset);
	} catch (...) {
		std::throw_with_nested(SkipError{
				fmt::format("Failed to skip {} bytes", offset),
			});
	}

	if (skipped != offset)
		throw SkipError{
			fmt::format("Object ended after {} of {} bytes to be skipped",
				    skipped, offset),
		};
}

TransferResult
StreamExecutor::Transfer(BlobReader &reader, const DeliveryPlan &plan,
			 ResponseSink &sink,
			 const ChildLogger &logger) noexcept
{
	uint64_t written = 0;

	try {
		const auto buffer = std::make_unique_for_overwrite<std::byte[]>(CHUNK_SIZE);

		while (written < plan.content_length) {
			const std::size_t max =
				std::min<uint64_t>(plan.content_length - written,
						   CHUNK_SIZE);
			const std::size_t nbytes =
				reader.Read({buffer.get(), max});
			if (nbytes == 0) {
				logger.Fmt(2, "Object ended after {} of {} bytes (range {}-{}/{})",
					   written, plan.content_length,
					   plan.start, plan.end, plan.size);
				return {TransferStatus::INCOMPLETE, written};
			}

			sink.Write({buffer.get(), nbytes});
			written += nbytes;
		}

		sink.End();
	} catch (const SinkClosedError &e) {
		logger.Fmt(4, "Client disconnected after {} bytes: {}",
			   written, e.what());
		return {TransferStatus::CLIENT_GONE, written};
	} catch (...) {
		logger.Fmt(1, "Transfer failed after {} bytes: {}",
			   written, std::current_exception());
		return {TransferStatus::FAILED, written};
	}

	return {TransferStatus::COMPLETE, written};
}

TransferResult
StreamExecutor::Execute(std::string_view key, const DeliveryPlan &plan,
			const DeliveryResponse &response,
			ResponseSink &sink, Deadline deadline,
			const ChildLogger &logger)
{
	/* the reader is released when this function returns, on
	   every path */
	const std::unique_ptr<BlobReader> reader = store.Open(key, deadline);

	if (plan.start > 0)
		SkipTo(*reader, plan.start);

	try {
		sink.Commit(response);
	} catch (const SinkClosedError &e) {
		logger.Fmt(4, "Client disconnected before headers were sent: {}",
			   e.what());
		return {TransferStatus::CLIENT_GONE, 0};
	} catch (...) {
		logger.Fmt(1, "Failed to send headers: {}",
			   std::current_exception());
		return {TransferStatus::FAILED, 0};
	}

	return Transfer(*reader, plan, sink, logger);
}

} // namespace Media
