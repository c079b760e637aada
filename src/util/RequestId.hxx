// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

/**
 * The maximum length of a client-supplied correlation id.
 */
static constexpr std::size_t MAX_CORRELATION_ID_LENGTH = 128;

/**
 * Generate a random (version 4) UUID in its canonical lower-case
 * string form, to be used as request id.
 *
 * Throws on error.
 */
std::string
GenerateRequestId();

/**
 * Is this a client-supplied correlation id which may be echoed and
 * logged?  It must be non-empty, not longer than
 * #MAX_CORRELATION_ID_LENGTH and consist of visible ASCII characters
 * only.
 */
[[gnu::pure]]
bool
IsValidCorrelationId(std::string_view s) noexcept;
