// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "HostParser.hxx"
#include "util/CharUtil.hxx"

#include <algorithm>
#include <charconv>
#include <stdexcept>

static constexpr bool
IsValidHostnameChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '-' || ch == '.' ||
		ch == '*'; /* for wildcards */
}

static constexpr bool
IsValidIPv6Char(char ch) noexcept
{
	return IsDigitASCII(ch) ||
		(ch >= 'a' && ch <= 'f') ||
		(ch >= 'A' && ch <= 'F') ||
		ch == ':';
}

static std::size_t
FindIPv6End(std::string_view s, std::size_t i) noexcept
{
	while (i < s.size() && IsValidIPv6Char(s[i]))
		++i;
	return i;
}

ExtractHostResult
ExtractHost(std::string_view src) noexcept
{
	if (src.empty())
		return {{}, src};

	if (IsValidHostnameChar(src.front())) {
		std::size_t colon = src.npos, i = 1;

		for (; i < src.size() && (IsValidHostnameChar(src[i]) || src[i] == ':'); ++i) {
			if (src[i] != ':')
				continue;

			if (colon != src.npos) {
				/* found a second colon: assume it's an IPv6
				   address */
				const auto end = FindIPv6End(src, i + 1);
				return {src.substr(0, end), src.substr(end)};
			}

			/* remember the position of the first colon */
			colon = i;
		}

		if (colon != src.npos)
			/* hostname ends at colon */
			i = colon;

		return {src.substr(0, i), src.substr(i)};
	} else if (src.starts_with("::")) {
		/* IPv6 address beginning with "::" */
		const auto end = FindIPv6End(src, 2);
		return {src.substr(0, end), src.substr(end)};
	} else if (src.front() == '[') {
		/* "[hostname]:port" (IPv6?) */
		const auto end = src.find(']', 1);
		if (end == src.npos || end == 1)
			return {{}, src};

		return {src.substr(1, end - 1), src.substr(end + 1)};
	} else
		return {{}, src};
}

HostAndPort
ParseHostAndPort(std::string_view src)
{
	const auto e = ExtractHost(src);
	if (e.HasFailed())
		throw std::invalid_argument{"Malformed host"};

	if (e.rest.size() < 2 || e.rest.front() != ':')
		throw std::invalid_argument{"Port number expected"};

	const auto port_string = e.rest.substr(1);
	if (!std::all_of(port_string.begin(), port_string.end(), IsDigitASCII))
		throw std::invalid_argument{"Malformed port number"};

	unsigned port;
	const auto [ptr, ec] = std::from_chars(port_string.data(),
					       port_string.data() + port_string.size(),
					       port);
	if (ec != std::errc{} || port == 0 || port > 0xffff)
		throw std::invalid_argument{"Malformed port number"};

	return {e.host, static_cast<uint16_t>(port)};
}
