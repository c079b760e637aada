// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <algorithm>
#include <chrono>

/**
 * An absolute point in time after which a blocking operation shall
 * be aborted.
 */
using Deadline = std::chrono::steady_clock::time_point;

inline Deadline
MakeDeadline(std::chrono::steady_clock::duration timeout) noexcept
{
	return std::chrono::steady_clock::now() + timeout;
}

inline bool
IsExpired(Deadline deadline) noexcept
{
	return std::chrono::steady_clock::now() >= deadline;
}

/**
 * Returns the number of milliseconds until the deadline expires (at
 * least 1 unless it has already expired), suitable for poll().
 */
inline int
GetRemainingMilliseconds(Deadline deadline) noexcept
{
	const auto remaining = deadline - std::chrono::steady_clock::now();
	if (remaining <= remaining.zero())
		return 0;

	const auto ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
	return static_cast<int>(std::clamp<decltype(ms)>(ms, 1, 1000 * 3600));
}
