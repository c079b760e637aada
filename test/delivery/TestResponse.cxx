// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "delivery/Response.hxx"
#include "delivery/Plan.hxx"

#include <gtest/gtest.h>

using namespace Media;
using std::string_view_literals::operator""sv;

static constexpr DeliveryPlan full_video{
	.start = 0,
	.end = 999,
	.content_length = 1000,
	.size = 1000,
	.status = HttpStatus::OK,
	.is_video = true,
	.partial = false,
};

static constexpr DeliveryPlan partial_video{
	.start = 100,
	.end = 199,
	.content_length = 100,
	.size = 1000,
	.status = HttpStatus::PARTIAL_CONTENT,
	.is_video = true,
	.partial = true,
};

static constexpr DeliveryPlan full_generic{
	.start = 0,
	.end = 9,
	.content_length = 10,
	.size = 10,
	.status = HttpStatus::OK,
	.is_video = false,
	.partial = false,
};

static void
ExpectHeader(const DeliveryResponse &response, std::string_view name,
	     std::string_view expected)
{
	const auto *value = response.FindHeader(name);
	ASSERT_NE(value, nullptr) << name;
	EXPECT_EQ(*value, expected) << name;
}

TEST(DeliveryResponse, FullVideo)
{
	const auto r = MakeContentResponse(full_video,
					   {"video/mp4", "clip.mp4"},
					   std::chrono::seconds{3600});
	EXPECT_EQ(r.status, HttpStatus::OK);
	EXPECT_EQ(r.content_length, 1000U);
	EXPECT_TRUE(r.body.empty());
	ExpectHeader(r, "content-type", "video/mp4");
	ExpectHeader(r, "accept-ranges", "bytes");
	ExpectHeader(r, "content-disposition", "inline; filename=\"clip.mp4\"");
	ExpectHeader(r, "cache-control", "public, max-age=3600");
	EXPECT_EQ(r.FindHeader("content-range"), nullptr);
	EXPECT_EQ(r.FindHeader("last-modified"), nullptr);
}

TEST(DeliveryResponse, PartialVideo)
{
	const auto r = MakeContentResponse(partial_video,
					   {"video/webm", "a.webm"},
					   std::chrono::seconds{60});
	EXPECT_EQ(r.status, HttpStatus::PARTIAL_CONTENT);
	EXPECT_EQ(r.content_length, 100U);
	ExpectHeader(r, "content-range", "bytes 100-199/1000");
	ExpectHeader(r, "content-disposition", "inline; filename=\"a.webm\"");
	ExpectHeader(r, "cache-control", "public, max-age=60");
}

TEST(DeliveryResponse, Generic)
{
	const auto r = MakeContentResponse(full_generic,
					   {"application/pdf", "report.pdf"},
					   std::chrono::seconds{3600});
	EXPECT_EQ(r.status, HttpStatus::OK);
	EXPECT_EQ(r.content_length, 10U);
	ExpectHeader(r, "content-type", "application/pdf");
	ExpectHeader(r, "accept-ranges", "bytes");
	ExpectHeader(r, "content-disposition", "attachment; filename=\"report.pdf\"");
	EXPECT_EQ(r.FindHeader("cache-control"), nullptr);
	EXPECT_EQ(r.FindHeader("content-range"), nullptr);
}

TEST(DeliveryResponse, LastModified)
{
	const auto r = MakeContentResponse(full_generic,
					   {
						   .content_type = "text/plain",
						   .file_name = "a.txt",
						   .last_modified = std::chrono::system_clock::from_time_t(1234567890),
					   },
					   std::chrono::seconds{3600});
	ExpectHeader(r, "last-modified", "Fri, 13 Feb 2009 23:31:30 GMT");
}

TEST(DeliveryResponse, Unsatisfiable)
{
	const auto r = MakeUnsatisfiableResponse();
	EXPECT_EQ(r.status, HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE);
	EXPECT_EQ(r.content_length, 0U);
	EXPECT_TRUE(r.body.empty());
	EXPECT_TRUE(r.headers.empty());
}

TEST(DeliveryResponse, Error)
{
	const auto r = MakeErrorResponse(HttpStatus::NOT_FOUND, "Not Found");
	EXPECT_EQ(r.status, HttpStatus::NOT_FOUND);
	EXPECT_EQ(r.body, "Not Found\n");
	EXPECT_EQ(r.content_length, 10U);
	ExpectHeader(r, "content-type", "text/plain");
}

TEST(DeliveryResponse, ContentDisposition)
{
	EXPECT_EQ(MakeContentDisposition(true, "a.mp4"),
		  "inline; filename=\"a.mp4\"");
	EXPECT_EQ(MakeContentDisposition(false, ""),
		  "attachment; filename=\"\"");
	EXPECT_EQ(MakeContentDisposition(false, "say \"hi\".txt"),
		  "attachment; filename=\"say \\\"hi\\\".txt\"");
	EXPECT_EQ(MakeContentDisposition(false, "a\\b"),
		  "attachment; filename=\"a\\\\b\"");
	EXPECT_EQ(MakeContentDisposition(false, "a\r\nb\x7f"),
		  "attachment; filename=\"ab\"");
}
