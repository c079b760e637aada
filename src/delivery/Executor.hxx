// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "time/Deadline.hxx"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

class ChildLogger;

namespace Media {

class BlobStore;
class BlobReader;
class ResponseSink;
struct DeliveryPlan;
struct DeliveryResponse;

/**
 * Positioning the stream at the start of the range has failed.
 */
class SkipError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

enum class TransferStatus : uint8_t {
	/**
	 * All bytes of the plan have been sent.
	 */
	COMPLETE,

	/**
	 * The object ended before all bytes were sent.
	 */
	INCOMPLETE,

	/**
	 * The client has gone away.
	 */
	CLIENT_GONE,

	/**
	 * Reading from the backing store or writing to the client has
	 * failed after the headers were committed.
	 */
	FAILED,
};

struct TransferResult {
	TransferStatus status;

	/**
	 * The number of body bytes written to the sink.
	 */
	uint64_t written;
};

/**
 * Copies the bytes described by a #DeliveryPlan from the #BlobStore
 * to a #ResponseSink.
 */
class StreamExecutor {
	BlobStore &store;

public:
	static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

	explicit StreamExecutor(BlobStore &_store) noexcept
		:store(_store) {}

	/**
	 * Open the object, skip to the start of the range, commit
	 * the response headers and copy the body.
	 *
	 * Failures before the headers have been committed are thrown:
	 * #BackingStoreError if the object cannot be opened,
	 * #SkipError if skipping fails.  Everything after that is
	 * logged and reported in the return value.
	 */
	TransferResult Execute(std::string_view key, const DeliveryPlan &plan,
			       const DeliveryResponse &response,
			       ResponseSink &sink, Deadline deadline,
			       const ChildLogger &logger);

private:
	static void SkipTo(BlobReader &reader, uint64_t offset);

	static TransferResult Transfer(BlobReader &reader,
				       const DeliveryPlan &plan,
				       ResponseSink &sink,
				       const ChildLogger &logger) noexcept;
};

} // namespace Media
