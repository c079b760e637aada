// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "PgRecordStore.hxx"
#include "Error.hxx"
#include "pg/Error.hxx"
#include "time/ISO8601.hxx"

#include <fmt/core.h>

#include <charconv>
#include <stdexcept>

namespace Media {

Pg::Connection
PgRecordStore::Acquire(Deadline deadline)
{
	{
		const std::scoped_lock lock{mutex};
		if (!idle.empty()) {
			auto connection = std::move(idle.front());
			idle.pop_front();
			return connection;
		}
	}

	Pg::Connection connection;
	connection.Connect(conninfo.c_str(), deadline);

	if (!schema.empty())
		connection.SetSchema(schema, deadline);

	return connection;
}

void
PgRecordStore::Release(Pg::Connection &&connection) noexcept
{
	if (connection.GetStatus() != CONNECTION_OK)
		return;

	const std::scoped_lock lock{mutex};
	if (idle.size() < max_idle)
		idle.emplace_back(std::move(connection));
}

static uint64_t
ParseSize(std::string_view s)
{
	uint64_t value;
	const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(),
					       value);
	if (ec != std::errc{} || ptr != s.data() + s.size())
		throw std::runtime_error{fmt::format("Malformed file_size: '{}'", s)};

	return value;
}

inline std::optional<Record>
PgRecordStore::Query(Pg::Connection &connection, std::string_view id,
		     Deadline deadline)
{
	const std::string id_string{id};
	const char *const params[]{id_string.c_str()};

	const auto result =
		connection.ExecuteParams("SELECT media_id, s3_key, file_name, file_type, file_size, downloaded_at "
					 "FROM media WHERE media_id=$1",
					 params, deadline);
	if (result.GetRowCount() == 0)
		return std::nullopt;

	const auto row = result.GetRow(0);

	Record record;
	record.id = row[0];
	record.key = row[1];
	record.file_name = row[2];
	record.content_type = row[3];

	if (const auto size = row.GetOptional(4))
		record.size = ParseSize(*size);

	if (const auto created = row.GetOptional(5))
		record.created = ParseISO8601(std::string{*created}.c_str());

	return record;
}

std::optional<Record>
PgRecordStore::Lookup(std::string_view id, Deadline deadline)
{
	try {
		auto connection = Acquire(deadline);
		auto record = Query(connection, id, deadline);
		Release(std::move(connection));
		return record;
	} catch (const Pg::TimeoutError &) {
		std::throw_with_nested(RecordStoreTimeout{
				fmt::format("Timeout while looking up media '{}'", id),
			});
	} catch (...) {
		std::throw_with_nested(RecordStoreError{
				fmt::format("Failed to look up media '{}'", id),
			});
	}
}

} // namespace Media
