// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Connection.hxx"
#include "Error.hxx"
#include "system/Error.hxx"

#include <cerrno>
#include <new>

#include <poll.h>

namespace Pg {

void
Connection::WaitSocket(short events, Deadline deadline)
{
	struct pollfd pfd{
		.fd = GetSocket(),
		.events = events,
		.revents = 0,
	};

	while (true) {
		const int timeout = GetRemainingMilliseconds(deadline);
		if (timeout <= 0)
			throw TimeoutError{"PostgreSQL operation timed out"};

		int result = ::poll(&pfd, 1, timeout);
		if (result > 0)
			return;

		if (result == 0)
			throw TimeoutError{"PostgreSQL operation timed out"};

		if (errno != EINTR)
			throw MakeErrno("poll() failed");
	}
}

void
Connection::Connect(const char *conninfo, Deadline deadline)
{
	assert(!IsDefined());

	conn = ::PQconnectStart(conninfo);
	if (conn == nullptr)
		throw std::bad_alloc();

	if (GetStatus() == CONNECTION_BAD)
		throw std::runtime_error(GetErrorMessage());

	if (::PQsetnonblocking(conn, 1) != 0)
		throw std::runtime_error(GetErrorMessage());

	/* after PQconnectStart(), libpq expects us to wait for the
	   socket to become writable first */
	PostgresPollingStatusType status = PGRES_POLLING_WRITING;

	while (true) {
		switch (status) {
		case PGRES_POLLING_OK:
			return;

		case PGRES_POLLING_FAILED:
			throw std::runtime_error(GetErrorMessage());

		case PGRES_POLLING_READING:
			WaitSocket(POLLIN, deadline);
			break;

		case PGRES_POLLING_WRITING:
			WaitSocket(POLLOUT, deadline);
			break;

		case PGRES_POLLING_ACTIVE:
			break;
		}

		status = ::PQconnectPoll(conn);
	}
}

inline void
Connection::Flush(Deadline deadline)
{
	while (true) {
		const int result = ::PQflush(conn);
		if (result == 0)
			return;

		if (result < 0)
			throw std::runtime_error(GetErrorMessage());

		WaitSocket(POLLIN|POLLOUT, deadline);

		if (::PQconsumeInput(conn) == 0)
			throw std::runtime_error(GetErrorMessage());
	}
}

inline Result
Connection::ReceiveResult(Deadline deadline)
{
	while (::PQisBusy(conn)) {
		WaitSocket(POLLIN, deadline);

		if (::PQconsumeInput(conn) == 0)
			throw std::runtime_error(GetErrorMessage());
	}

	return Result{::PQgetResult(conn)};
}

Result
Connection::ExecuteParams(const char *query,
			  std::span<const char *const> values,
			  Deadline deadline)
{
	assert(IsDefined());
	assert(query != nullptr);

	if (::PQsendQueryParams(conn, query, values.size(), nullptr,
				values.data(), nullptr, nullptr, 0) == 0)
		throw std::runtime_error(GetErrorMessage());

	Flush(deadline);

	/* keep the first result, but drain all others so the
	   connection is ready for the next query */
	Result result;
	while (true) {
		auto next = ReceiveResult(deadline);
		if (!next.IsDefined())
			break;

		if (!result.IsDefined())
			result = std::move(next);
	}

	if (!result.IsDefined())
		throw std::runtime_error(GetErrorMessage());

	if (result.IsError())
		throw Error(std::move(result));

	return result;
}

void
Connection::SetSchema(std::string_view schema, Deadline deadline)
{
	const std::string sql = "SET search_path TO " + EscapeIdentifier(schema);
	Execute(sql.c_str(), deadline);
}

std::string
Connection::EscapeIdentifier(std::string_view src) const
{
	assert(IsDefined());

	char *escaped = ::PQescapeIdentifier(conn, src.data(), src.size());
	if (escaped == nullptr)
		throw std::runtime_error(GetErrorMessage());

	std::string result{escaped};
	::PQfreemem(escaped);
	return result;
}

} /* namespace Pg */
