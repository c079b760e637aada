// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BlobStore.hxx"

#include <algorithm>
#include <array>

namespace Media {

uint64_t
BlobReader::Skip(uint64_t n)
{
	std::array<std::byte, 16384> buffer;

	uint64_t skipped = 0;
	while (skipped < n) {
		const std::size_t max = std::min<uint64_t>(n - skipped,
							   buffer.size());
		const std::size_t nbytes = Read(std::span{buffer}.first(max));
		if (nbytes == 0)
			break;

		skipped += nbytes;
	}

	return skipped;
}

} // namespace Media
