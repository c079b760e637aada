// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Plan.hxx"
#include "http/Range.hxx"

#include <cassert>

namespace Media {

DeliveryPlan
MakeDeliveryPlan(uint64_t size, ContentClass content_class,
		 const HttpRangeRequest &range) noexcept
{
	assert(!range.IsInvalid());
	assert(range.size == size);

	const bool is_video = content_class == ContentClass::VIDEO;

	if (is_video && range.IsValid()) {
		assert(range.first <= range.last);
		assert(range.last < size);

		return {
			.start = range.first,
			.end = range.last,
			.content_length = range.GetLength(),
			.size = size,
			.status = HttpStatus::PARTIAL_CONTENT,
			.is_video = true,
			.partial = true,
		};
	}

	return {
		.start = 0,
		.end = size > 0 ? size - 1 : 0,
		.content_length = size,
		.size = size,
		.status = HttpStatus::OK,
		.is_video = is_video,
		.partial = false,
	};
}

} // namespace Media
