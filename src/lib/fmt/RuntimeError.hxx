// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <stdexcept>

template<typename S, typename... Args>
std::runtime_error
FmtRuntimeError(const S &format_str, Args&&... args) noexcept
{
	return std::runtime_error{
		fmt::vformat(format_str, fmt::make_format_args(args...)),
	};
}
