// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "RecordStore.hxx"

#include <functional>
#include <map>
#include <string>

namespace Media {

/**
 * A #RecordStore which keeps all records in memory.  It is filled
 * once (e.g. by LoadRecordFile()) and is read-only afterwards, which
 * makes Lookup() safe to call from multiple threads.
 */
class MemoryRecordStore final : public RecordStore {
	std::map<std::string, Record, std::less<>> records;

public:
	/**
	 * Throws std::runtime_error if a record with the same
	 * identifier exists already.
	 */
	void Insert(Record &&record);

	bool empty() const noexcept {
		return records.empty();
	}

	std::size_t size() const noexcept {
		return records.size();
	}

	/* virtual methods from class RecordStore */
	std::optional<Record> Lookup(std::string_view id,
				     Deadline deadline) override;
};

} // namespace Media
