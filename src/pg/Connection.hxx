// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Result.hxx"
#include "time/Deadline.hxx"

#include <libpq-fe.h>

#include <cassert>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace Pg {

/**
 * A blocking operation on a #Connection did not complete before its
 * deadline.  The connection is in an undefined state afterwards and
 * must be discarded.
 */
class TimeoutError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * A thin C++ wrapper for a PGconn pointer.  All blocking operations
 * use libpq's non-blocking API and poll() the socket, so they can be
 * aborted at a #Deadline.
 */
class Connection {
	PGconn *conn = nullptr;

public:
	Connection() = default;

	Connection(Connection &&other) noexcept
		:conn(std::exchange(other.conn, nullptr)) {}

	Connection &operator=(Connection &&other) noexcept {
		std::swap(conn, other.conn);
		return *this;
	}

	~Connection() noexcept {
		Disconnect();
	}

	bool IsDefined() const noexcept {
		return conn != nullptr;
	}

	[[gnu::pure]]
	ConnStatusType GetStatus() const noexcept {
		assert(IsDefined());

		return ::PQstatus(conn);
	}

	[[gnu::pure]]
	const char *GetErrorMessage() const noexcept {
		assert(IsDefined());

		return ::PQerrorMessage(conn);
	}

	[[gnu::pure]]
	int GetSocket() const noexcept {
		assert(IsDefined());

		return ::PQsocket(conn);
	}

	void Disconnect() noexcept {
		if (conn != nullptr) {
			::PQfinish(conn);
			conn = nullptr;
		}
	}

	/**
	 * Establish a connection.
	 *
	 * Throws #TimeoutError if the deadline expires, and
	 * std::runtime_error on other errors.
	 */
	void Connect(const char *conninfo, Deadline deadline);

	/**
	 * Execute a query with text parameters and wait for its
	 * result.
	 *
	 * Throws #Error if the server reports an error, #TimeoutError
	 * if the deadline expires, std::runtime_error on other
	 * errors.
	 */
	Result ExecuteParams(const char *query,
			     std::span<const char *const> values,
			     Deadline deadline);

	Result Execute(const char *query, Deadline deadline) {
		return ExecuteParams(query, {}, deadline);
	}

	/**
	 * Set the search path to the specified schema.
	 *
	 * Throws on error.
	 */
	void SetSchema(std::string_view schema, Deadline deadline);

	std::string EscapeIdentifier(std::string_view src) const;

private:
	/**
	 * Wait until the socket becomes readable and/or writable.
	 *
	 * Throws #TimeoutError if the deadline expires.
	 */
	void WaitSocket(short events, Deadline deadline);

	void Flush(Deadline deadline);
	Result ReceiveResult(Deadline deadline);
};

} /* namespace Pg */
