// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "MemoryRecordStore.hxx"

#include "lib/fmt/RuntimeError.hxx"

namespace Media {

void
MemoryRecordStore::Insert(Record &&record)
{
	auto [it, inserted] = records.try_emplace(record.id);
	if (!inserted)
		throw FmtRuntimeError("Duplicate media id '{}'", record.id);

	it->second = std::move(record);
}

std::optional<Record>
MemoryRecordStore::Lookup(std::string_view id, Deadline)
{
	if (auto i = records.find(id); i != records.end())
		return i->second;

	return std::nullopt;
}

} // namespace Media
