#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>

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

RequestTask Ok(RequestResponseCycle& cycle) {
  co_await cycle.start(http::ResponseHead(200));
  co_await cycle.send("ok");
}

RequestTask BodyWithoutStart(RequestResponseCycle& cycle) { co_await cycle.send("garbage"); }

RequestTask Throwing(RequestResponseCycle& cycle) {
  if (cycle.request().target() == "/throw") {
    throw std::runtime_error("handler failure");
  }
  co_await cycle.start(http::ResponseHead(200));
  co_await cycle.send("fine");
}

RequestTask ThrowAfterStreaming(RequestResponseCycle& cycle) {
  co_await cycle.start(http::ResponseHead(200));
  co_await cycle.send("first part", true);
  throw std::runtime_error("mid-stream failure");
}

}  // namespace

TEST(HttpErrors, MalformedRequestLine) {
  test::TestServer ts(HttpServerConfig{}, Ok);
  const std::string resp = test::sendAndCollect(ts.port(), "BROKEN\r\n\r\n");
  EXPECT_TRUE(resp.starts_with("HTTP/1.1 400 Bad Request\r\n"));
  EXPECT_TRUE(resp.contains("Connection: close"));
  ts.stop();
  EXPECT_EQ(ts.server.stats().parseErrors, 1U);
}

TEST(HttpErrors, UnsupportedVersion) {
  test::TestServer ts(HttpServerConfig{}, Ok);
  EXPECT_TRUE(test::sendAndCollect(ts.port(), "GET / HTTP/2.0\r\n\r\n").starts_with("HTTP/1.1 505 "));
}

TEST(HttpErrors, HeadersTooLarge) {
  test::TestServer ts(HttpServerConfig{}.withMaxHeaderBytes(256), Ok);
  const std::string req = "GET / HTTP/1.1\r\nX-Big: " + std::string(1000, 'h') + "\r\n\r\n";
  EXPECT_TRUE(test::sendAndCollect(ts.port(), req).starts_with("HTTP/1.1 431 "));
}

TEST(HttpErrors, BodyTooLarge) {
  test::TestServer ts(HttpServerConfig{}.withMaxBodyBytes(16), Ok);
  const std::string resp =
      test::sendAndCollect(ts.port(), "POST / HTTP/1.1\r\nContent-Length: 17\r\n\r\n01234567890123456");
  EXPECT_TRUE(resp.starts_with("HTTP/1.1 413 "));
}

TEST(HttpErrors, UnsupportedTransferEncoding) {
  test::TestServer ts(HttpServerConfig{}, Ok);
  const std::string resp = test::sendAndCollect(ts.port(), "POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
  EXPECT_TRUE(resp.starts_with("HTTP/1.1 501 "));
}

TEST(HttpErrors, ConflictingFraming) {
  test::TestServer ts(HttpServerConfig{}, Ok);
  const std::string resp = test::sendAndCollect(
      ts.port(), "POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\nContent-Length: 3\r\n\r\n");
  EXPECT_TRUE(resp.starts_with("HTTP/1.1 400 "));
}

TEST(HttpErrors, BodyBeforeStartGivesCleanInternalError) {
  test::TestServer ts(HttpServerConfig{}, BodyWithoutStart);
  const std::string resp = test::sendAndCollect(ts.port(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
  const auto parsed = test::parseResponse(resp);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->statusCode, 500);
  EXPECT_EQ(parsed->body, "Internal Server Error");
  EXPECT_FALSE(resp.contains("garbage"));
  EXPECT_EQ(test::countOccurrences(resp, "HTTP/1.1"), 1);
  ts.stop();
  EXPECT_EQ(ts.server.stats().applicationErrors, 1U);
}

TEST(HttpErrors, ExceptionGives500AndServerKeepsServing) {
  test::TestServer ts(HttpServerConfig{}, Throwing);
  EXPECT_TRUE(test::simpleGet(ts.port(), "/throw").starts_with("HTTP/1.1 500 "));
  EXPECT_TRUE(test::simpleGet(ts.port(), "/other").ends_with("fine"));
}

TEST(HttpErrors, ExceptionMidStreamCutsConnection) {
  test::TestServer ts(HttpServerConfig{}, ThrowAfterStreaming);
  const std::string resp = test::sendAndCollect(ts.port(), "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_TRUE(resp.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_TRUE(resp.contains("first part"));
  // Incomplete chunked framing: no terminating chunk, and no second status line.
  EXPECT_FALSE(resp.ends_with("0\r\n\r\n"));
  EXPECT_EQ(test::countOccurrences(resp, "HTTP/1.1"), 1);
}

TEST(HttpErrors, HeaderReadTimeout) {
  test::TestServer ts(HttpServerConfig{}.withHeaderReadTimeout(50ms), Ok);
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "GET / HTTP/1.1\r\nHost: x\r\n");
  test::setRecvTimeout(cnx.fd(), 2s);
  const std::string resp = test::recvUntilClosed(cnx.fd());
  EXPECT_TRUE(resp.starts_with("HTTP/1.1 408 Request Timeout\r\n"));
  ts.stop();
  EXPECT_EQ(ts.server.stats().timeouts, 1U);
}

TEST(HttpErrors, BodyReadTimeout) {
  test::TestServer ts(HttpServerConfig{}.withBodyReadTimeout(50ms), Ok);
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 100\r\n\r\nonly a few");
  test::setRecvTimeout(cnx.fd(), 2s);
  const std::string resp = test::recvUntilClosed(cnx.fd());
  // The application answered without reading the body, the stalled remainder only closes the connection.
  EXPECT_TRUE(resp.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_EQ(test::countOccurrences(resp, "HTTP/1.1"), 1);
  ts.stop();
  EXPECT_EQ(ts.server.stats().timeouts, 1U);
}

TEST(HttpErrors, StalledBodyOfReadingApplication) {
  test::TestServer ts(HttpServerConfig{}.withBodyReadTimeout(50ms), [](RequestResponseCycle& cycle) -> RequestTask {
    while ((co_await cycle.receive()).type == BodyEvent::Type::Chunk) {
    }
    co_await cycle.start(http::ResponseHead(200));
    co_await cycle.send("unreachable");
  });
  test::ClientConnection cnx(ts.port());
  test::sendAll(cnx.fd(), "POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 100\r\n\r\nonly a few");
  test::setRecvTimeout(cnx.fd(), 2s);
  const std::string resp = test::recvUntilClosed(cnx.fd());
  EXPECT_TRUE(resp.starts_with("HTTP/1.1 408 Request Timeout\r\n"));
  EXPECT_FALSE(resp.contains("unreachable"));
}
