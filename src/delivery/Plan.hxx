// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Classifier.hxx"
#include "http/Status.hxx"

#include <cstdint>

struct HttpRangeRequest;

namespace Media {

/**
 * Describes which bytes of an object shall be sent, and with which
 * status.
 */
struct DeliveryPlan {
	/**
	 * The first byte to be sent.
	 */
	uint64_t start;

	/**
	 * The last byte to be sent (inclusive).  Meaningless if
	 * #content_length is zero.
	 */
	uint64_t end;

	/**
	 * The number of bytes in the response body.
	 */
	uint64_t content_length;

	/**
	 * The total size of the object.
	 */
	uint64_t size;

	HttpStatus status;

	bool is_video;

	/**
	 * Is this a "206 Partial Content" response?
	 */
	bool partial;
};

/**
 * Build the plan from the object size, its class and the parsed
 * "Range" header.  Ranges are only honoured for
 * #ContentClass::VIDEO.
 *
 * @param range a range which is not HttpRangeRequest::Type::INVALID
 */
[[gnu::pure]]
DeliveryPlan
MakeDeliveryPlan(uint64_t size, ContentClass content_class,
		 const HttpRangeRequest &range) noexcept;

} // namespace Media
