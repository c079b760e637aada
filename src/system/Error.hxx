// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <system_error>
#include <utility>

#include <errno.h>

/**
 * Returns the error_category to be used to wrap errno values.
 */
static inline const std::error_category &
ErrnoCategory() noexcept
{
	return std::generic_category();
}

static inline std::system_error
MakeErrno(int code, const char *msg) noexcept
{
	return std::system_error(std::error_code(code, ErrnoCategory()),
				 msg);
}

static inline std::system_error
MakeErrno(const char *msg) noexcept
{
	return MakeErrno(errno, msg);
}

template<typename S, typename... Args>
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return MakeErrno(code,
			 fmt::vformat(format_str,
				      fmt::make_format_args(args...)).c_str());
}

template<typename S, typename... Args>
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	return FmtErrno(errno, format_str, std::forward<Args>(args)...);
}

[[gnu::pure]]
static inline bool
IsErrno(const std::system_error &e, int code) noexcept
{
	return e.code().category() == ErrnoCategory() &&
		e.code().value() == code;
}

[[gnu::pure]]
static inline bool
IsFileNotFound(const std::system_error &e) noexcept
{
	return IsErrno(e, ENOENT);
}
