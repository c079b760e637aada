// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "http/Status.hxx"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace Media {

struct DeliveryPlan;

/**
 * The status and headers of a response, built before the first byte
 * is written.  Header names are lower case.
 */
struct DeliveryResponse {
	HttpStatus status = HttpStatus::OK;
	std::multimap<std::string, std::string, std::less<>> headers;

	/**
	 * The length of the body announced in the "Content-Length"
	 * header.
	 */
	uint64_t content_length = 0;

	/**
	 * The body of a response generated by this server (error
	 * messages).  Object contents are streamed separately and are
	 * not stored here.
	 */
	std::string body;

	/**
	 * Returns the value of the first header with the given name,
	 * or nullptr if there is none.
	 */
	[[gnu::pure]]
	const std::string *FindHeader(std::string_view name) const noexcept {
		auto i = headers.find(name);
		return i != headers.end() ? &i->second : nullptr;
	}

	/**
	 * Set a "text/plain" body.
	 */
	void MoveTextPlain(std::string &&_body) noexcept;
};

/**
 * Attributes of the object which appear in the response headers.
 */
struct ContentInfo {
	std::string_view content_type;
	std::string_view file_name;

	/**
	 * The modification time; the epoch if unknown.
	 */
	std::chrono::system_clock::time_point last_modified{};
};

/**
 * Build a "200 OK" or "206 Partial Content" response for the given
 * plan.
 *
 * @param cache_max_age the "max-age" directive of the
 * "Cache-Control" header sent for videos
 */
DeliveryResponse
MakeContentResponse(const DeliveryPlan &plan, const ContentInfo &info,
		    std::chrono::seconds cache_max_age);

/**
 * Build a "416 Range Not Satisfiable" response without body.
 */
DeliveryResponse
MakeUnsatisfiableResponse() noexcept;

/**
 * Build an error response with a one-line "text/plain" body.
 */
DeliveryResponse
MakeErrorResponse(HttpStatus status, std::string_view message);

/**
 * Build the value of a "Content-Disposition" header, escaping quotes
 * and backslashes in the file name.
 *
 * @param inline_ true for "inline", false for "attachment"
 */
std::string
MakeContentDisposition(bool inline_, std::string_view file_name);

} // namespace Media
