// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <libpq-fe.h>

#include <cassert>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace Pg {

/**
 * One row of a #Result.  It is only valid as long as the #Result
 * exists.
 */
class Row {
	const PGresult *result;
	int row;

public:
	constexpr Row(const PGresult *_result, int _row) noexcept
		:result(_result), row(_row) {}

	[[gnu::pure]]
	bool IsNull(int column) const noexcept {
		return ::PQgetisnull(result, row, column);
	}

	/**
	 * Returns the value as text; NULL is returned as an empty
	 * string.
	 */
	[[gnu::pure]]
	std::string_view operator[](int column) const noexcept {
		return {
			::PQgetvalue(result, row, column),
			static_cast<std::size_t>(::PQgetlength(result, row, column)),
		};
	}

	/**
	 * Like operator[], but returns std::nullopt for NULL.
	 */
	[[gnu::pure]]
	std::optional<std::string_view> GetOptional(int column) const noexcept {
		if (IsNull(column))
			return std::nullopt;

		return (*this)[column];
	}
};

/**
 * A thin C++ wrapper for a PGresult pointer.
 */
class Result {
	PGresult *result = nullptr;

public:
	Result() = default;
	explicit Result(PGresult *_result) noexcept:result(_result) {}

	Result(Result &&other) noexcept
		:result(std::exchange(other.result, nullptr)) {}

	~Result() noexcept {
		if (result != nullptr)
			::PQclear(result);
	}

	Result &operator=(Result &&other) noexcept {
		using std::swap;
		swap(result, other.result);
		return *this;
	}

	bool IsDefined() const noexcept {
		return result != nullptr;
	}

	[[gnu::pure]]
	bool IsError() const noexcept {
		assert(IsDefined());

		switch (::PQresultStatus(result)) {
		case PGRES_BAD_RESPONSE:
		case PGRES_NONFATAL_ERROR:
		case PGRES_FATAL_ERROR:
			return true;

		default:
			return false;
		}
	}

	[[gnu::pure]]
	const char *GetErrorMessage() const noexcept {
		assert(IsDefined());

		return ::PQresultErrorMessage(result);
	}

	/**
	 * Returns the SQLSTATE code, or nullptr if there is none.
	 */
	[[gnu::pure]]
	const char *GetErrorType() const noexcept {
		assert(IsDefined());

		return ::PQresultErrorField(result, PG_DIAG_SQLSTATE);
	}

	[[gnu::pure]]
	int GetRowCount() const noexcept {
		assert(IsDefined());

		return ::PQntuples(result);
	}

	Row GetRow(int row) const noexcept {
		assert(IsDefined());
		assert(row < GetRowCount());

		return {result, row};
	}
};

} /* namespace Pg */
