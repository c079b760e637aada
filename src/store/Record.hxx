// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace Media {

/**
 * The metadata of one stored media object, as kept by the
 * #RecordStore.
 */
struct Record {
	std::string id;

	/**
	 * The key of the object in the #BlobStore.
	 */
	std::string key;

	/**
	 * The file name presented to the client in the
	 * "Content-Disposition" header.
	 */
	std::string file_name;

	/**
	 * The declared MIME type.  May be empty if unknown.
	 */
	std::string content_type;

	/**
	 * The declared size in bytes.  The #BlobStore's size is
	 * authoritative; this one is only used for consistency
	 * checks.
	 */
	uint64_t size = 0;

	/**
	 * The time the object was stored; the epoch if unknown.
	 */
	std::chrono::system_clock::time_point created{};

	bool HasCreationTime() const noexcept {
		return created != std::chrono::system_clock::time_point{};
	}
};

} // namespace Media
