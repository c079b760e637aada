// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "store/ContentType.hxx"

#include <gtest/gtest.h>

using namespace Media;

TEST(ContentType, Known)
{
	EXPECT_EQ(GuessContentType("a.mp4"), "video/mp4");
	EXPECT_EQ(GuessContentType("dir/b.webm"), "video/webm");
	EXPECT_EQ(GuessContentType("c.MOV"), "video/quicktime");
	EXPECT_EQ(GuessContentType("photo.JPG"), "image/jpeg");
	EXPECT_EQ(GuessContentType("x.y.pdf"), "application/pdf");
}

TEST(ContentType, Unknown)
{
	EXPECT_EQ(GuessContentType(""), "");
	EXPECT_EQ(GuessContentType("mp4"), "");
	EXPECT_EQ(GuessContentType("file."), "");
	EXPECT_EQ(GuessContentType("file.xyz"), "");
	EXPECT_EQ(GuessContentType("dir.mp4/file"), "");
}
