// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "time/Deadline.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace Media {

struct BlobMetadata {
	/**
	 * The exact size of the object in bytes.
	 */
	uint64_t size;

	/**
	 * The MIME type known to the backing store; may be empty.
	 */
	std::string content_type;
};

/**
 * A sequential byte stream of one object in the #BlobStore.
 *
 * Methods throw #BackingStoreError on error.
 */
class BlobReader {
public:
	virtual ~BlobReader() noexcept = default;

	/**
	 * Read bytes from the current position.
	 *
	 * @return the number of bytes read; 0 at the end of the
	 * object
	 */
	virtual std::size_t Read(std::span<std::byte> dest) = 0;

	/**
	 * Advance the position by the given number of bytes without
	 * returning them.  The default implementation reads and
	 * discards; implementations with native seeking should
	 * override it.
	 *
	 * @return the number of bytes skipped, which is less than
	 * the given value only if the object ended
	 */
	virtual uint64_t Skip(uint64_t n);
};

/**
 * Access to the bytes of stored objects.  Implementations must be
 * thread-safe.
 *
 * Methods throw #BackingStoreError on error and
 * #BackingStoreTimeout if the deadline expires.
 */
class BlobStore {
public:
	virtual ~BlobStore() noexcept = default;

	virtual BlobMetadata GetMetadata(std::string_view key,
					 Deadline deadline) = 0;

	/**
	 * Open a stream of the object, positioned at offset 0.
	 */
	virtual std::unique_ptr<BlobReader> Open(std::string_view key,
						 Deadline deadline) = 0;
};

} // namespace Media
