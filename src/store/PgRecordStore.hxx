// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "RecordStore.hxx"
#include "pg/Connection.hxx"

#include <list>
#include <mutex>
#include <string>

namespace Media {

/**
 * A #RecordStore which queries the "media" table in a PostgreSQL
 * database.  Idle connections are kept in a list and reused; a
 * connection which has failed is discarded.
 */
class PgRecordStore final : public RecordStore {
	const std::string conninfo;
	const std::string schema;

	/**
	 * The maximum number of idle connections kept.
	 */
	const std::size_t max_idle;

	std::mutex mutex;
	std::list<Pg::Connection> idle;

public:
	PgRecordStore(std::string _conninfo, std::string _schema,
		      std::size_t _max_idle=16) noexcept
		:conninfo(std::move(_conninfo)), schema(std::move(_schema)),
		 max_idle(_max_idle) {}

	/* virtual methods from class RecordStore */
	std::optional<Record> Lookup(std::string_view id,
				     Deadline deadline) override;

private:
	Pg::Connection Acquire(Deadline deadline);
	void Release(Pg::Connection &&connection) noexcept;

	std::optional<Record> Query(Pg::Connection &connection,
				    std::string_view id, Deadline deadline);
};

} // namespace Media
