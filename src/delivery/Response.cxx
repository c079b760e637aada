// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Response.hxx"
#include "Plan.hxx"
#include "http/Date.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

namespace Media {

void
DeliveryResponse::MoveTextPlain(std::string &&_body) noexcept
{
	body = std::move(_body);
	content_length = body.size();
	headers.emplace("content-type"sv, "text/plain"sv);
}

std::string
MakeContentDisposition(bool inline_, std::string_view file_name)
{
	std::string result = inline_ ? "inline" : "attachment";
	result += "; filename=\"";

	for (const char ch : file_name) {
		if (ch == '"' || ch == '\\')
			result.push_back('\\');
		else if (static_cast<unsigned char>(ch) < 0x20 || ch == 0x7f)
			/* control characters would break the header */
			continue;

		result.push_back(ch);
	}

	result.push_back('"');
	return result;
}

DeliveryResponse
MakeContentResponse(const DeliveryPlan &plan, const ContentInfo &info,
		    std::chrono::seconds cache_max_age)
{
	DeliveryResponse response;
	response.status = plan.status;
	response.content_length = plan.content_length;

	auto &headers = response.headers;
	headers.emplace("content-type"sv, info.content_type);
	headers.emplace("accept-ranges"sv, "bytes"sv);
	headers.emplace("content-disposition"sv,
			MakeContentDisposition(plan.is_video, info.file_name));

	if (plan.partial)
		headers.emplace("content-range"sv,
				fmt::format("bytes {}-{}/{}"sv,
					    plan.start, plan.end, plan.size));

	if (plan.is_video)
		headers.emplace("cache-control"sv,
				fmt::format("public, max-age={}"sv,
					    cache_max_age.count()));

	if (info.last_modified != std::chrono::system_clock::time_point{})
		headers.emplace("last-modified"sv,
				http_date_format(info.last_modified));

	return response;
}

DeliveryResponse
MakeUnsatisfiableResponse() noexcept
{
	return {
		.status = HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE,
	};
}

DeliveryResponse
MakeErrorResponse(HttpStatus status, std::string_view message)
{
	DeliveryResponse response;
	response.status = status;

	std::string body{message};
	body.push_back('\n');
	response.MoveTextPlain(std::move(body));
	return response;
}

} // namespace Media
