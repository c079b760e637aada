// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "delivery/Plan.hxx"
#include "http/Range.hxx"

#include <gtest/gtest.h>

using namespace Media;

static HttpRangeRequest
ParseRange(uint64_t size, const char *value)
{
	HttpRangeRequest range{size};
	if (value != nullptr)
		range.ParseRangeHeader(value);
	return range;
}

TEST(DeliveryPlan, VideoFull)
{
	const auto plan = MakeDeliveryPlan(1000, ContentClass::VIDEO,
					   ParseRange(1000, nullptr));
	EXPECT_EQ(plan.status, HttpStatus::OK);
	EXPECT_FALSE(plan.partial);
	EXPECT_TRUE(plan.is_video);
	EXPECT_EQ(plan.start, 0U);
	EXPECT_EQ(plan.end, 999U);
	EXPECT_EQ(plan.content_length, 1000U);
	EXPECT_EQ(plan.size, 1000U);
}

TEST(DeliveryPlan, VideoRange)
{
	auto plan = MakeDeliveryPlan(1000, ContentClass::VIDEO,
				     ParseRange(1000, "bytes=0-99"));
	EXPECT_EQ(plan.status, HttpStatus::PARTIAL_CONTENT);
	EXPECT_TRUE(plan.partial);
	EXPECT_EQ(plan.start, 0U);
	EXPECT_EQ(plan.end, 99U);
	EXPECT_EQ(plan.content_length, 100U);

	plan = MakeDeliveryPlan(1000, ContentClass::VIDEO,
				ParseRange(1000, "bytes=999-999"));
	EXPECT_EQ(plan.status, HttpStatus::PARTIAL_CONTENT);
	EXPECT_EQ(plan.start, 999U);
	EXPECT_EQ(plan.end, 999U);
	EXPECT_EQ(plan.content_length, 1U);

	plan = MakeDeliveryPlan(1000, ContentClass::VIDEO,
				ParseRange(1000, "bytes=500-"));
	EXPECT_EQ(plan.start, 500U);
	EXPECT_EQ(plan.end, 999U);
	EXPECT_EQ(plan.content_length, 500U);
}

TEST(DeliveryPlan, GenericIgnoresRange)
{
	const auto plan = MakeDeliveryPlan(1000, ContentClass::GENERIC,
					   ParseRange(1000, "bytes=0-99"));
	EXPECT_EQ(plan.status, HttpStatus::OK);
	EXPECT_FALSE(plan.partial);
	EXPECT_FALSE(plan.is_video);
	EXPECT_EQ(plan.start, 0U);
	EXPECT_EQ(plan.content_length, 1000U);
}

TEST(DeliveryPlan, Empty)
{
	const auto plan = MakeDeliveryPlan(0, ContentClass::VIDEO,
					   ParseRange(0, nullptr));
	EXPECT_EQ(plan.status, HttpStatus::OK);
	EXPECT_EQ(plan.start, 0U);
	EXPECT_EQ(plan.content_length, 0U);
}
