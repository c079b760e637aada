// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpTestClient.hxx"
#include "net/BeastSink.hxx"
#include "delivery/Response.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <optional>

using std::string_view_literals::operator""sv;

namespace {

struct SinkFixture {
	SocketPair pair;
	SyncStream server{pair.server, boost::asio::ip::tcp::v4(),
			  std::chrono::seconds{10}};
	std::optional<HttpTestClient> client{std::in_place, pair.client};
};

static Media::DeliveryResponse
MakeTextResponse(std::string_view body)
{
	Media::DeliveryResponse response;
	response.MoveTextPlain(std::string{body});
	return response;
}

} // anonymous namespace

TEST(BeastSink, Basic)
{
	SinkFixture f;

	BeastSink sink{f.server, 11, true, false, "r1"sv, "c1"sv};
	EXPECT_FALSE(sink.IsCommitted());

	Media::SendResponse(sink, MakeTextResponse("hello\n"), false);
	EXPECT_TRUE(sink.IsCommitted());
	EXPECT_EQ(sink.GetStatus(), HttpStatus::OK);
	EXPECT_EQ(sink.GetBytesWritten(), 6U);
	EXPECT_TRUE(sink.IsComplete());

	const auto response = f.client->Receive();
	EXPECT_EQ(response.result_int(), 200U);
	EXPECT_EQ(GetHeader(response, boost::beast::http::field::content_type), "text/plain");
	EXPECT_EQ(GetHeader(response, boost::beast::http::field::content_length), "6");
	EXPECT_EQ(GetHeader(response, "x-request-id"), "r1");
	EXPECT_EQ(GetHeader(response, "x-correlation-id"), "c1");
	EXPECT_TRUE(response.keep_alive());
	EXPECT_EQ(response.body(), "hello\n");
}

/* a 416 has no body, but the connection stays usable */
TEST(BeastSink, Unsatisfiable)
{
	SinkFixture f;

	{
		BeastSink sink{f.server, 11, true, false, "r1"sv, "c1"sv};
		Media::SendResponse(sink, Media::MakeUnsatisfiableResponse(),
				    false);
		EXPECT_TRUE(sink.IsComplete());
	}

	{
		BeastSink sink{f.server, 11, true, false, "r2"sv, "c2"sv};
		Media::SendResponse(sink, MakeTextResponse("ok\n"), false);
		EXPECT_TRUE(sink.IsComplete());
	}

	auto response = f.client->Receive();
	EXPECT_EQ(response.result_int(), 416U);
	EXPECT_EQ(GetHeader(response, boost::beast::http::field::content_length), "0");
	EXPECT_TRUE(response.keep_alive());
	EXPECT_TRUE(response.body().empty());

	response = f.client->Receive();
	EXPECT_EQ(response.result_int(), 200U);
	EXPECT_EQ(GetHeader(response, "x-request-id"), "r2");
	EXPECT_EQ(response.body(), "ok\n");
}

TEST(BeastSink, Head)
{
	SinkFixture f;

	Media::DeliveryResponse r;
	r.status = HttpStatus::OK;
	r.content_length = 1000;
	r.headers.emplace("content-type"sv, "video/mp4"sv);

	BeastSink sink{f.server, 11, false, true, "r1"sv, "c1"sv};
	sink.Commit(r);
	sink.End();
	EXPECT_TRUE(sink.IsComplete());
	EXPECT_EQ(sink.GetBytesWritten(), 0U);

	f.server.ShutdownSend();

	const auto response = f.client->Receive(true);
	EXPECT_EQ(response.result_int(), 200U);
	EXPECT_EQ(GetHeader(response, boost::beast::http::field::content_length), "1000");
	EXPECT_EQ(GetHeader(response, boost::beast::http::field::content_type), "video/mp4");
	EXPECT_FALSE(response.keep_alive());

	/* no body bytes follow the header */
	EXPECT_TRUE(f.client->IsClosed());
}

/* fewer bytes than announced: the connection must not be reused */
TEST(BeastSink, Incomplete)
{
	SinkFixture f;

	Media::DeliveryResponse r;
	r.status = HttpStatus::OK;
	r.content_length = 100;

	BeastSink sink{f.server, 11, true, false, "r1"sv, "c1"sv};
	sink.Commit(r);
	sink.Write(AsBytes("0123456789"sv));
	EXPECT_EQ(sink.GetBytesWritten(), 10U);
	EXPECT_FALSE(sink.IsComplete());
}

/* a closed peer is reported as SinkClosedError */
TEST(BeastSink, PeerGone)
{
	SinkFixture f;
	f.client.reset();

	const std::string chunk(65536, 'x');

	Media::DeliveryResponse r;
	r.status = HttpStatus::OK;
	r.content_length = 64 * chunk.size();

	BeastSink sink{f.server, 11, true, false, "r1"sv, "c1"sv};
	EXPECT_THROW({
			sink.Commit(r);
			for (unsigned i = 0; i < 64; ++i)
				sink.Write(AsBytes(chunk));
		}, Media::SinkClosedError);

	EXPECT_FALSE(sink.IsComplete());
}
