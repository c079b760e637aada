// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "http/Range.hxx"

#include <gtest/gtest.h>

static HttpRangeRequest
Parse(uint64_t size, std::string_view value) noexcept
{
	HttpRangeRequest range{size};
	range.ParseRangeHeader(value);
	return range;
}

TEST(HttpRange, None)
{
	const HttpRangeRequest range{1000};
	EXPECT_EQ(range.type, HttpRangeRequest::Type::NONE);
	EXPECT_FALSE(range.IsValid());
	EXPECT_FALSE(range.IsInvalid());
}

TEST(HttpRange, Bounded)
{
	auto range = Parse(1000, "bytes=0-99");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.first, 0u);
	EXPECT_EQ(range.last, 99u);
	EXPECT_EQ(range.GetLength(), 100u);

	range = Parse(1000, "bytes=100-199");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.first, 100u);
	EXPECT_EQ(range.last, 199u);
}

TEST(HttpRange, SingleByte)
{
	auto range = Parse(1000, "bytes=999-999");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.first, 999u);
	EXPECT_EQ(range.last, 999u);
	EXPECT_EQ(range.GetLength(), 1u);

	range = Parse(1000, "bytes=0-0");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.GetLength(), 1u);
}

TEST(HttpRange, OpenEnd)
{
	auto range = Parse(1000, "bytes=500-");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.first, 500u);
	EXPECT_EQ(range.last, 999u);

	range = Parse(1000, "bytes=0-");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.first, 0u);
	EXPECT_EQ(range.last, 999u);

	range = Parse(1000, "bytes=999-");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.GetLength(), 1u);
}

TEST(HttpRange, LastByte)
{
	const auto range = Parse(1000, "bytes=0-999");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.last, 999u);
}

TEST(HttpRange, Suffix)
{
	auto range = Parse(1000, "bytes=-100");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.first, 900u);
	EXPECT_EQ(range.last, 999u);

	/* longer than the object: the whole object */
	range = Parse(1000, "bytes=-5000");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.first, 0u);
	EXPECT_EQ(range.last, 999u);

	EXPECT_TRUE(Parse(1000, "bytes=-0").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=-").IsInvalid());
	EXPECT_TRUE(Parse(0, "bytes=-10").IsInvalid());
}

TEST(HttpRange, BeyondEnd)
{
	EXPECT_TRUE(Parse(1000, "bytes=1000-1005").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=1000-").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=0-1000").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=5000-6000").IsInvalid());
}

TEST(HttpRange, Reversed)
{
	EXPECT_TRUE(Parse(1000, "bytes=100-99").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=999-0").IsInvalid());
}

TEST(HttpRange, EmptyObject)
{
	EXPECT_TRUE(Parse(0, "bytes=0-").IsInvalid());
	EXPECT_TRUE(Parse(0, "bytes=0-0").IsInvalid());
}

TEST(HttpRange, Malformed)
{
	EXPECT_TRUE(Parse(1000, "items=0-10").IsInvalid());
	EXPECT_TRUE(Parse(1000, "").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=-").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=abc-def").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=1-x").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=+1-2").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes= 1-2").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=1-2 ").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=12").IsInvalid());
	EXPECT_TRUE(Parse(1000, "Bytes=0-10").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes 0-10").IsInvalid());
}

TEST(HttpRange, MultipleRanges)
{
	EXPECT_TRUE(Parse(1000, "bytes=0-10,20-30").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=0-10,20").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=0-1-2").IsInvalid());
}

TEST(HttpRange, Overflow)
{
	EXPECT_TRUE(Parse(1000, "bytes=99999999999999999999999-").IsInvalid());
	EXPECT_TRUE(Parse(1000, "bytes=0-99999999999999999999999").IsInvalid());
}

TEST(HttpRange, LargeObject)
{
	const uint64_t size = uint64_t{1} << 40;
	const auto range = Parse(size, "bytes=1099511627000-");
	ASSERT_TRUE(range.IsValid());
	EXPECT_EQ(range.first, 1099511627000u);
	EXPECT_EQ(range.last, size - 1);
	EXPECT_EQ(range.GetLength(), size - 1099511627000u);
}
