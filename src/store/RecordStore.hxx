// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Record.hxx"
#include "time/Deadline.hxx"

#include <optional>
#include <string_view>

namespace Media {

/**
 * Read-only access to the media records.  Implementations must be
 * thread-safe.
 */
class RecordStore {
public:
	virtual ~RecordStore() noexcept = default;

	/**
	 * Look up a record by its identifier.
	 *
	 * Throws #RecordStoreError on error and #RecordStoreTimeout
	 * if the deadline expires.
	 *
	 * @return the record or std::nullopt if there is no record
	 * with the given identifier
	 */
	virtual std::optional<Record> Lookup(std::string_view id,
					     Deadline deadline) = 0;
};

} // namespace Media
