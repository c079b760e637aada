// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "http/Date.hxx"

#include <gtest/gtest.h>

TEST(HttpDate, Format)
{
	EXPECT_EQ(http_date_format(std::chrono::system_clock::time_point{}), "Thu, 01 Jan 1970 00:00:00 GMT");
	EXPECT_EQ(http_date_format(std::chrono::system_clock::from_time_t(1234567890)), "Fri, 13 Feb 2009 23:31:30 GMT");
	EXPECT_EQ(http_date_format(std::chrono::system_clock::from_time_t(1714564800)), "Wed, 01 May 2024 12:00:00 GMT");
}

TEST(HttpDate, FormatBuffer)
{
	char buffer[HTTP_DATE_LENGTH];
	char *end = http_date_format_r(buffer, std::chrono::system_clock::from_time_t(951782400));
	EXPECT_EQ(end, buffer + HTTP_DATE_LENGTH);
	EXPECT_EQ(std::string_view(buffer, end), "Tue, 29 Feb 2000 00:00:00 GMT");
}
