#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <thread>

#include "keelson/http-response-head.hpp"
#include "keelson/http-server-config.hpp"
#include "keelson/http-server.hpp"
#include "keelson/request-response-cycle.hpp"
#include "keelson/request-task.hpp"
#include "keelson/test_server_fixture.hpp"
#include "keelson/test_util.hpp"

using namespace std::chrono_literals;
using namespace keelson;

namespace {

// Answers with the number of body bytes received and the number of Chunk events it took.
RequestTask CountBody(RequestResponseCycle& cycle) {
  std::size_t nbBytes = 0;
  std::size_t nbEvents = 0;
  std::size_t nbEnd = 0;
  for (;;) {
    const BodyEvent event = co_await cycle.receive();
    if (event.type == BodyEvent::Type::Chunk) {
      nbBytes += event.data.size();
      ++nbEvents;
      continue;
    }
    if (event.type == BodyEvent::Type::Disconnect) {
      co_return;
    }
    ++nbEnd;
    break;
  }
  co_await cycle.start(http::ResponseHead(200));
  co_await cycle.send(std::to_string(nbBytes) + " " + std::to_string(nbEnd));
}

constexpr std::size_t kLargeResponseSize = std::size_t{32} << 20;

// Streams kLargeResponseSize bytes in 64 KiB pieces.
RequestTask LargeStream(RequestResponseCycle& cycle) {
  co_await cycle.start(http::ResponseHead(200).header("Content-Type", "application/octet-stream"));
  const std::string piece(std::size_t{64} << 10, 'z');
  for (std::size_t sent = 0; sent < kLargeResponseSize; sent += piece.size()) {
    if (co_await cycle.send(piece, true) == SendStatus::Disconnected) {
      co_return;
    }
  }
  co_await cycle.send("");
}

}  // namespace

TEST(HttpStreaming, ChunkedUploadIn1KbWrites) {
  test::TestServer ts(HttpServerConfig{}, CountBody);
  test::ClientConnection cnx(ts.port());
  const int fd = cnx.fd();

  std::string wire("POST /upload HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: chunked\r\nConnection: close\r\n\r\n");
  for (int chunkNb = 0; chunkNb < 50; ++chunkNb) {
    wire += "400\r\n";
    wire.append(1024, static_cast<char>('A' + (chunkNb % 26)));
    wire += "\r\n";
  }
  wire += "0\r\n\r\n";

  const std::string_view wireView(wire);
  for (std::size_t pos = 0; pos < wireView.size(); pos += 1024) {
    ASSERT_TRUE(test::sendAll(fd, wireView.substr(pos, 1024)));
    std::this_thread::sleep_for(1ms);
  }

  test::setRecvTimeout(fd, 2s);
  const auto response = test::parseResponse(test::recvUntilClosed(fd));
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->statusCode, 200);
  EXPECT_EQ(response->body, "51200 1");
}

TEST(HttpStreaming, FixedLengthUploadInPieces) {
  test::TestServer ts(HttpServerConfig{}, CountBody);
  test::ClientConnection cnx(ts.port());
  const int fd = cnx.fd();
  test::sendAll(fd, "PUT /data HTTP/1.1\r\nHost: x\r\nContent-Length: 3000\r\n\r\n");
  for (int pieceNb = 0; pieceNb < 3; ++pieceNb) {
    std::this_thread::sleep_for(2ms);
    test::sendAll(fd, std::string(1000, 'p'));
  }
  const auto response = test::parseResponse(test::recvWithTimeout(fd));
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->body, "3000 1");
  EXPECT_EQ(response->headers.at("Connection"), "keep-alive");
}

TEST(HttpStreaming, ExpectContinue) {
  test::TestServer ts(HttpServerConfig{}, CountBody);
  test::ClientConnection cnx(ts.port());
  const int fd = cnx.fd();
  test::sendAll(fd, "POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 4\r\nExpect: 100-continue\r\n\r\n");

  std::string interim;
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!interim.contains("\r\n\r\n") && std::chrono::steady_clock::now() < deadline) {
    interim += test::recvWithTimeout(fd, 50ms);
  }
  EXPECT_EQ(interim, "HTTP/1.1 100 Continue\r\n\r\n");

  test::sendAll(fd, "data");
  const auto response = test::parseResponse(test::recvWithTimeout(fd));
  ASSERT_TRUE(response.has_value());
  EXPECT_EQ(response->statusCode, 200);
  EXPECT_EQ(response->body, "4 1");
}

TEST(HttpStreaming, SlowReaderGetsWholeResponse) {
  test::TestServer ts(HttpServerConfig{}, LargeStream);
  test::ClientConnection cnx(ts.port());
  const int fd = cnx.fd();
  test::sendAll(fd, "GET /large HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");

  // Let the socket buffers fill up: the server has to stop producing.
  std::this_thread::sleep_for(200ms);
  test::setRecvTimeout(fd, 5s);
  const auto response = test::parseResponse(test::recvUntilClosed(fd));
  ASSERT_TRUE(response.has_value());
  EXPECT_TRUE(response->chunked);
  EXPECT_EQ(response->body.size(), kLargeResponseSize);

  ts.stop();
  const ServerStats stats = ts.server.stats();
  EXPECT_GE(stats.flowControlPauses, 1U);
  EXPECT_GE(stats.deferredWriteEvents, 1U);
  EXPECT_EQ(stats.totalRequestsServed, 1U);
}

TEST(HttpStreaming, ClientLeavingMidStreamIsReported) {
  test::TestServer ts(HttpServerConfig{}, LargeStream);
  {
    test::ClientConnection cnx(ts.port());
    test::sendAll(cnx.fd(), "GET /large HTTP/1.1\r\nHost: x\r\n\r\n");
    EXPECT_FALSE(test::recvWithTimeout(cnx.fd(), 50ms).empty());
  }
  // The exchange ends on its own once it observes the disconnect.
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (ts.server.serverState().activeConnections() != 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(ts.server.serverState().activeConnections(), 0U);
  ts.stop();
  EXPECT_EQ(ts.server.stats().clientDisconnects, 1U);
}
