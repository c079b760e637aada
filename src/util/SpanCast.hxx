// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Cast a std::span<const T> to a std::span<const std::byte>.
 */
template<typename T, std::size_t extent>
constexpr auto
AsBytes(std::span<T, extent> src) noexcept
{
	return std::as_bytes(src);
}

inline std::span<const std::byte>
AsBytes(std::string_view src) noexcept
{
	return {reinterpret_cast<const std::byte *>(src.data()), src.size()};
}

inline std::string_view
ToStringView(std::span<const std::byte> src) noexcept
{
	return {reinterpret_cast<const char *>(src.data()), src.size()};
}
