// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "RequestId.hxx"
#include "CharUtil.hxx"
#include "system/Error.hxx"

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>

#include <sys/random.h>

static void
FillRandom(std::span<std::byte> dest)
{
	while (!dest.empty()) {
		const ssize_t nbytes = getrandom(dest.data(), dest.size(), 0);
		if (nbytes < 0) {
			if (errno == EINTR)
				continue;

			throw MakeErrno("getrandom() failed");
		}

		dest = dest.subspan(nbytes);
	}
}

std::string
GenerateRequestId()
{
	std::array<std::byte, 16> uuid;
	FillRandom(uuid);

	/* RFC 9562 4.1 and 5.4: version 4, variant 10xx */
	uuid[6] = (uuid[6] & std::byte{0x0f}) | std::byte{0x40};
	uuid[8] = (uuid[8] & std::byte{0x3f}) | std::byte{0x80};

	static constexpr char hex_digits[] = "0123456789abcdef";

	std::string result;
	result.reserve(36);

	for (std::size_t i = 0; i < uuid.size(); ++i) {
		if (i == 4 || i == 6 || i == 8 || i == 10)
			result.push_back('-');

		const auto value = std::to_integer<unsigned>(uuid[i]);
		result.push_back(hex_digits[value >> 4]);
		result.push_back(hex_digits[value & 0xf]);
	}

	return result;
}

bool
IsValidCorrelationId(std::string_view s) noexcept
{
	return !s.empty() && s.size() <= MAX_CORRELATION_ID_LENGTH &&
		std::all_of(s.begin(), s.end(), IsGraphASCII);
}
