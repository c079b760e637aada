// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <string_view>

struct ExtractHostResult {
	/**
	 * The host part of the address.
	 *
	 * If nothing was parsed, then this is a null string_view.
	 */
	std::string_view host;

	/**
	 * The rest of the string that was not parsed.  On success,
	 * this is usually empty or a colon followed by a port number.
	 */
	std::string_view rest;

	constexpr bool HasFailed() const noexcept {
		return host.data() == nullptr;
	}
};

/**
 * Extract the host from a string in the form "IP:PORT", where IP may
 * be an IPv4 address, a host name or an IPv6 address (enclosed in
 * square brackets if followed by a port).
 */
[[gnu::pure]]
ExtractHostResult
ExtractHost(std::string_view src) noexcept;

struct HostAndPort {
	std::string_view host;
	uint16_t port;
};

/**
 * Parse a "HOST:PORT" listener address.  The port is
 * mandatory.
 *
 * Throws std::invalid_argument on error.
 */
HostAndPort
ParseHostAndPort(std::string_view src);
