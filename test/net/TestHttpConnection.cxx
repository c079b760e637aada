// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HttpTestClient.hxx"
#include "delivery/FakeStores.hxx"
#include "delivery/Handler.hxx"
#include "net/HttpConnection.hxx"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace Media;
namespace http = boost::beast::http;

namespace {

/**
 * Serves one #HttpConnection on a worker thread; the test talks to
 * it through #client.
 */
struct ConnectionFixture {
	FakeRecordStore records;
	FakeBlobStore blobs;
	DeliveryHandler handler{records, blobs, DeliveryConfig{}};

	const std::string video = MakeTestData(1000);

	std::atomic_bool stopping{false};

	SocketPair pair;

	/* a long idle timeout: no test may depend on it expiring */
	HttpConnection connection{pair.server, boost::asio::ip::tcp::v4(),
				  std::chrono::minutes{10},
				  handler, stopping};

	HttpTestClient client{pair.client};

	std::thread thread;

	ConnectionFixture() {
		records.Add({
			.id = "v1",
			.key = "uploads/clip.mp4",
			.file_name = "clip.mp4",
			.content_type = "video/mp4",
			.size = 1000,
		});
		blobs.Add("uploads/clip.mp4", std::string{video});
	}

	~ConnectionFixture() noexcept {
		if (thread.joinable()) {
			stopping = true;
			connection.Stop();
			thread.join();
		}
	}

	/**
	 * Launch the worker thread.  The stores must not be modified
	 * after this.
	 */
	void Start() {
		thread = std::thread{[this]{ connection.Run(); }};
	}

	/**
	 * Wait until HttpConnection::Run() has returned.
	 */
	void Join() {
		thread.join();
	}
};

} // anonymous namespace

TEST(HttpConnection, Range)
{
	ConnectionFixture f;

	f.Start();
	f.client.Send(http::verb::get, "/media/v1", "bytes=0-99");
	const auto response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 206U);
	EXPECT_EQ(GetHeader(response, http::field::content_range), "bytes 0-99/1000");
	EXPECT_EQ(GetHeader(response, http::field::content_length), "100");
	EXPECT_EQ(response.body(), f.video.substr(0, 100));
	EXPECT_TRUE(response.keep_alive());
}

/* the connection survives a 416 and serves the next request */
TEST(HttpConnection, KeepAliveAfterUnsatisfiable)
{
	ConnectionFixture f;

	f.Start();
	f.client.Send(http::verb::get, "/media/v1", "bytes=5000-");
	auto response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 416U);
	EXPECT_EQ(GetHeader(response, http::field::content_length), "0");
	EXPECT_TRUE(response.keep_alive());

	f.client.Send(http::verb::get, "/media/v1", "bytes=990-");
	response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 206U);
	EXPECT_EQ(response.body(), f.video.substr(990));
}

TEST(HttpConnection, Head)
{
	ConnectionFixture f;

	f.Start();
	f.client.Send(http::verb::head, "/media/v1");
	auto response = f.client.Receive(true);
	EXPECT_EQ(response.result_int(), 200U);
	EXPECT_EQ(GetHeader(response, http::field::content_length), "1000");
	EXPECT_TRUE(response.body().empty());

	/* if the HEAD response had a body, this would parse it as
	   the next response */
	f.client.Send(http::verb::get, "/media/v1", "bytes=0-9");
	response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 206U);
	EXPECT_EQ(response.body(), f.video.substr(0, 10));
}

TEST(HttpConnection, MethodNotAllowed)
{
	ConnectionFixture f;

	f.Start();
	f.client.Send(http::verb::post, "/media/v1");
	const auto response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 405U);
	EXPECT_EQ(GetHeader(response, http::field::allow), "GET, HEAD");
}

TEST(HttpConnection, NotFound)
{
	ConnectionFixture f;

	f.Start();
	f.client.Send(http::verb::get, "/media/nope");
	auto response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 404U);

	f.client.Send(http::verb::get, "/elsewhere");
	response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 404U);

	f.client.Send(http::verb::get, "/health");
	response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 200U);
	EXPECT_EQ(response.body(), "ok\n");
}

TEST(HttpConnection, CorrelationId)
{
	ConnectionFixture f;

	f.Start();
	f.client.Send(http::verb::get, "/media/v1", "bytes=0-0", "abc-123");
	auto response = f.client.Receive();
	EXPECT_EQ(GetHeader(response, "x-correlation-id"), "abc-123");
	const auto request_id = GetHeader(response, "x-request-id");
	EXPECT_FALSE(request_id.empty());

	/* without a correlation id, the request id is used */
	f.client.Send(http::verb::get, "/media/v1", "bytes=0-0");
	response = f.client.Receive();
	EXPECT_FALSE(GetHeader(response, "x-request-id").empty());
	EXPECT_NE(GetHeader(response, "x-request-id"), request_id);
	EXPECT_EQ(GetHeader(response, "x-correlation-id"),
		  GetHeader(response, "x-request-id"));
}

/* a short source stream: the response cannot be completed, so the
   connection is closed */
TEST(HttpConnection, IncompleteClosesConnection)
{
	ConnectionFixture f;
	f.blobs.Truncate("uploads/clip.mp4", 500);

	f.Start();
	f.client.Send(http::verb::get, "/media/v1");
	const auto raw = f.client.ReceiveAll();
	f.Join();

	EXPECT_EQ(raw.compare(0, 12, "HTTP/1.1 200"), 0);
	EXPECT_NE(raw.find("Content-Length: 1000\r\n"), raw.npos);

	const auto header_end = raw.find("\r\n\r\n");
	ASSERT_NE(header_end, raw.npos);
	EXPECT_EQ(raw.substr(header_end + 4), f.video.substr(0, 500));
}

/* shutting down does not wait for the idle timeout */
TEST(HttpConnection, Stop)
{
	ConnectionFixture f;

	f.Start();
	f.client.Send(http::verb::get, "/media/v1", "bytes=0-9");
	const auto response = f.client.Receive();
	EXPECT_EQ(response.result_int(), 206U);

	/* now the connection is idle, waiting for the next request */
	f.stopping = true;
	f.connection.Stop();
	f.Join();

	EXPECT_TRUE(f.client.IsClosed());
}

/* the client goes away while the response is being sent */
TEST(HttpConnection, ClientGone)
{
	ConnectionFixture f;
	f.blobs.Add("uploads/big.mp4", MakeTestData(16 * 1024 * 1024));
	f.records.Add({
		.id = "big",
		.key = "uploads/big.mp4",
		.file_name = "big.mp4",
		.content_type = "video/mp4",
		.size = 16 * 1024 * 1024,
	});

	f.Start();
	f.client.Send(http::verb::get, "/media/big");
	ASSERT_EQ(::shutdown(f.pair.client, SHUT_RDWR), 0);
	f.Join();

	EXPECT_EQ(f.blobs.n_opened, 1U);
	EXPECT_EQ(f.blobs.n_released, 1U);
}
