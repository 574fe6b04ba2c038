#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
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

// /big streams a large body in many pieces, other targets answer at once.
RequestTask BigThenSmall(RequestResponseCycle& cycle) {
  const std::string target(cycle.request().target());
  co_await cycle.start(http::ResponseHead(200));
  if (target == "/big") {
    for (int pieceNb = 0; pieceNb < 256; ++pieceNb) {
      co_await cycle.send(std::string(1024, 'b'), true);
    }
    co_await cycle.send("");
  } else {
    co_await cycle.send(target);
  }
}

}  // namespace

TEST(HttpPipelining, ResponsesInRequestOrder) {
  test::TestServer ts(HttpServerConfig{}, BigThenSmall);
  test::ClientConnection cnx(ts.port());
  const int fd = cnx.fd();
  test::setRecvTimeout(fd, 2s);

  test::sendAll(fd,
                "GET /big HTTP/1.1\r\nHost: x\r\n\r\n"
                "GET /second HTTP/1.1\r\nHost: x\r\n\r\n"
                "GET /third HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
  const auto responses = test::parseResponses(test::recvUntilClosed(fd));
  ASSERT_EQ(responses.size(), 3U);
  EXPECT_EQ(responses[0].body.size(), 256U * 1024U);
  EXPECT_TRUE(responses[0].chunked);
  EXPECT_EQ(responses[1].body, "/second");
  EXPECT_EQ(responses[2].body, "/third");
  EXPECT_EQ(responses[2].headers.at("Connection"), "close");
}

TEST(HttpPipelining, ManySmallRequestsInOneWrite) {
  test::TestServer ts(HttpServerConfig{}, BigThenSmall);
  test::ClientConnection cnx(ts.port());
  const int fd = cnx.fd();
  test::setRecvTimeout(fd, 2s);

  constexpr int kNbRequests = 20;
  std::string batch;
  for (int reqNb = 0; reqNb < kNbRequests; ++reqNb) {
    batch += "GET /r" + std::to_string(reqNb) + " HTTP/1.1\r\nHost: x\r\n";
    if (reqNb + 1 == kNbRequests) {
      batch += "Connection: close\r\n";
    }
    batch += "\r\n";
  }
  test::sendAll(fd, batch);
  const auto responses = test::parseResponses(test::recvUntilClosed(fd));
  ASSERT_EQ(responses.size(), static_cast<std::size_t>(kNbRequests));
  for (int reqNb = 0; reqNb < kNbRequests; ++reqNb) {
    EXPECT_EQ(responses[static_cast<std::size_t>(reqNb)].body, "/r" + std::to_string(reqNb));
  }
}

TEST(HttpPipelining, InvalidRequestAfterValidOne) {
  test::TestServer ts(HttpServerConfig{}, BigThenSmall);
  const std::string raw = test::sendAndCollect(ts.port(), "GET /ok HTTP/1.1\r\nHost: x\r\n\r\nBROKEN\r\n\r\n");
  const auto responses = test::parseResponses(raw);
  ASSERT_EQ(responses.size(), 2U);
  EXPECT_EQ(responses[0].statusCode, 200);
  EXPECT_EQ(responses[0].headers.at("Connection"), "close");
  EXPECT_EQ(responses[1].statusCode, 400);
}
