// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Result.hxx"

#include <exception>

namespace Pg {

/**
 * The server has rejected a query.  The error message is the one
 * reported by libpq.
 */
class Error final : public std::exception {
	Result result;

public:
	explicit Error(Result &&_result) noexcept
		:result(std::move(_result)) {}

	Error(Error &&other) noexcept = default;
	Error &operator=(Error &&other) noexcept = default;

	/**
	 * Returns the SQLSTATE code, e.g. "42P01" for "undefined
	 * table".
	 */
	[[gnu::pure]]
	const char *GetType() const noexcept {
		return result.GetErrorType();
	}

	[[gnu::pure]]
	const char *what() const noexcept override {
		return result.GetErrorMessage();
	}
};

} /* namespace Pg */
