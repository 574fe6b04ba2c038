#include "keelson/request-parser.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "keelson/http-request-head.hpp"
#include "keelson/http-status-code.hpp"

namespace keelson::http {

namespace {

constexpr RequestParser::Limits kLimits{1024, 64 * 1024};

// Feeds the parser like a connection does: bytes are appended to a buffer, consumed bytes are erased.
struct ParseRun {
  explicit ParseRun(RequestParser::Limits limits = kLimits) : parser(limits) {}

  // Appends data and parses until more input is needed or an error occurs.
  void feed(std::string_view data) {
    buffer.append(data);
    while (true) {
      std::size_t consumed = 0;
      const auto result = parser.parse(buffer, consumed);
      switch (result.event) {
        case RequestParser::Event::HeadComplete:
          heads.push_back(parser.takeHead());
          break;
        case RequestParser::Event::BodyData:
          body.append(result.data);
          ++nbBodyEvents;
          break;
        case RequestParser::Event::MessageComplete:
          ++nbMessages;
          break;
        case RequestParser::Event::Error:
          errorStatus = result.errorStatus;
          break;
        case RequestParser::Event::NeedMore:
          break;
      }
      buffer.erase(0, consumed);
      if (result.event == RequestParser::Event::NeedMore || result.event == RequestParser::Event::Error) {
        return;
      }
    }
  }

  RequestParser parser;
  std::string buffer;
  std::vector<RequestHead> heads;
  std::string body;
  int nbBodyEvents{};
  int nbMessages{};
  StatusCode errorStatus{};
};

}  // namespace

TEST(RequestParser, SimpleGet) {
  ParseRun run;
  run.feed("GET /index.html?x=1 HTTP/1.1\r\nHost: localhost\r\nUser-Agent: test\r\n\r\n");
  ASSERT_EQ(run.heads.size(), 1U);
  const RequestHead& head = run.heads[0];
  EXPECT_EQ(head.method(), "GET");
  EXPECT_EQ(head.target(), "/index.html?x=1");
  EXPECT_EQ(head.path(), "/index.html");
  EXPECT_EQ(head.query(), "x=1");
  EXPECT_EQ(head.version(), HTTP_1_1);
  ASSERT_EQ(head.headers().size(), 2U);
  EXPECT_EQ(head.headerValue("host"), "localhost");
  EXPECT_EQ(run.nbMessages, 1);
  EXPECT_TRUE(run.parser.atMessageBoundary());
  EXPECT_TRUE(run.buffer.empty());
}

TEST(RequestParser, HeadSplitAcrossManyReads) {
  ParseRun run;
  const std::string_view request = "POST /p HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello";
  for (char ch : request) {
    run.feed(std::string_view(&ch, 1));
  }
  ASSERT_EQ(run.heads.size(), 1U);
  EXPECT_EQ(run.body, "hello");
  EXPECT_EQ(run.nbMessages, 1);
}

TEST(RequestParser, BareLineFeedsAreAccepted) {
  ParseRun run;
  run.feed("GET / HTTP/1.0\nHost: a\n\n");
  ASSERT_EQ(run.heads.size(), 1U);
  EXPECT_EQ(run.heads[0].version(), HTTP_1_0);
  EXPECT_EQ(run.nbMessages, 1);
}

TEST(RequestParser, LeadingEmptyLinesAreIgnored) {
  ParseRun run;
  run.feed("\r\n\r\nGET / HTTP/1.1\r\n\r\n");
  EXPECT_EQ(run.nbMessages, 1);
  EXPECT_EQ(run.errorStatus, 0);
}

TEST(RequestParser, PipelinedRequestsStopAtEachBoundary) {
  ParseRun run;
  run.feed("GET / HTTP/1.1\r\n\r\nGET /second HTTP/1.1\r\n\r\n");
  ASSERT_EQ(run.heads.size(), 2U);
  EXPECT_EQ(run.heads[0].path(), "/");
  EXPECT_EQ(run.heads[1].path(), "/second");
  EXPECT_EQ(run.nbMessages, 2);
}

TEST(RequestParser, ChunkedBodyInSmallIncrements) {
  ParseRun run;
  run.feed("POST /upload HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n");
  ASSERT_EQ(run.heads.size(), 1U);
  EXPECT_TRUE(run.parser.isChunked());

  std::string wire;
  std::string expected;
  for (int idx = 0; idx < 50; ++idx) {
    const std::string payload(1024, static_cast<char>('a' + (idx % 26)));
    expected += payload;
    wire += "400\r\n" + payload + "\r\n";
  }
  wire += "0\r\n\r\n";
  for (std::size_t pos = 0; pos < wire.size(); pos += 1024) {
    run.feed(std::string_view(wire).substr(pos, 1024));
  }
  EXPECT_EQ(run.body.size(), 50U * 1024U);
  EXPECT_EQ(run.body, expected);
  EXPECT_EQ(run.nbMessages, 1);
}

TEST(RequestParser, ChunkExtensionsAndTrailersAreIgnored) {
  ParseRun run;
  run.feed("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n5;name=value\r\nhello\r\n0\r\nX-Trailer: 1\r\n\r\n");
  EXPECT_EQ(run.body, "hello");
  EXPECT_EQ(run.nbMessages, 1);
}

TEST(RequestParser, InvalidChunkSizeIsBadRequest) {
  ParseRun run;
  run.feed("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
  EXPECT_EQ(run.errorStatus, StatusCodeBadRequest);
  EXPECT_TRUE(run.parser.hasError());
}

TEST(RequestParser, MissingCrlfAfterChunkIsBadRequest) {
  ParseRun run;
  run.feed("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabcX\r\n");
  EXPECT_EQ(run.body, "abc");
  EXPECT_EQ(run.errorStatus, StatusCodeBadRequest);
}

TEST(RequestParser, MalformedRequestLine) {
  for (std::string_view request : {"GARBAGE\r\n\r\n", "GET /\r\n\r\n", "GET  / HTTP/1.1\r\n\r\n",
                                   "G(T / HTTP/1.1\r\n\r\n", "GET / HTTP/1.x\r\n\r\n"}) {
    ParseRun run;
    run.feed(request);
    EXPECT_EQ(run.errorStatus, StatusCodeBadRequest) << request;
  }
}

TEST(RequestParser, UnsupportedVersion) {
  ParseRun run;
  run.feed("GET / HTTP/2.0\r\n\r\n");
  EXPECT_EQ(run.errorStatus, StatusCodeHTTPVersionNotSupported);
}

TEST(RequestParser, InvalidHeaders) {
  for (std::string_view request : {"GET / HTTP/1.1\r\nNoColon\r\n\r\n", "GET / HTTP/1.1\r\nBad Name: v\r\n\r\n",
                                   "GET / HTTP/1.1\r\nA: b\r\n folded\r\n\r\n"}) {
    ParseRun run;
    run.feed(request);
    EXPECT_EQ(run.errorStatus, StatusCodeBadRequest) << request;
  }
}

TEST(RequestParser, HeadersTooLarge) {
  ParseRun run(RequestParser::Limits{128, 1024});
  run.feed("GET / HTTP/1.1\r\nX-Long: " + std::string(200, 'a'));
  EXPECT_EQ(run.errorStatus, StatusCodeRequestHeaderFieldsTooLarge);
}

TEST(RequestParser, FramingConflicts) {
  {
    ParseRun run;
    run.feed("POST / HTTP/1.1\r\nContent-Length: 3\r\nTransfer-Encoding: chunked\r\n\r\n");
    EXPECT_EQ(run.errorStatus, StatusCodeBadRequest);
  }
  {
    ParseRun run;
    run.feed("POST / HTTP/1.1\r\nContent-Length: 3\r\nContent-Length: 4\r\n\r\n");
    EXPECT_EQ(run.errorStatus, StatusCodeBadRequest);
  }
  {
    ParseRun run;
    run.feed("POST / HTTP/1.1\r\nContent-Length: -1\r\n\r\n");
    EXPECT_EQ(run.errorStatus, StatusCodeBadRequest);
  }
  {
    ParseRun run;
    run.feed("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
    EXPECT_EQ(run.errorStatus, StatusCodeNotImplemented);
  }
  {
    ParseRun run;
    run.feed("POST / HTTP/1.0\r\nTransfer-Encoding: chunked\r\n\r\n");
    EXPECT_EQ(run.errorStatus, StatusCodeBadRequest);
  }
}

TEST(RequestParser, IdenticalDuplicateContentLengthIsAccepted) {
  ParseRun run;
  run.feed("POST / HTTP/1.1\r\nContent-Length: 2\r\nContent-Length: 2\r\n\r\nok");
  EXPECT_EQ(run.body, "ok");
  EXPECT_EQ(run.nbMessages, 1);
}

TEST(RequestParser, BodyTooLarge) {
  {
    ParseRun run(RequestParser::Limits{1024, 10});
    run.feed("POST / HTTP/1.1\r\nContent-Length: 11\r\n\r\n");
    EXPECT_EQ(run.errorStatus, StatusCodePayloadTooLarge);
  }
  {
    ParseRun run(RequestParser::Limits{1024, 10});
    run.feed("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n8\r\n12345678\r\n8\r\n");
    EXPECT_EQ(run.body, "12345678");
    EXPECT_EQ(run.errorStatus, StatusCodePayloadTooLarge);
  }
}

TEST(RequestParser, ErrorIsSticky) {
  ParseRun run;
  run.feed("BAD\r\n");
  EXPECT_TRUE(run.parser.hasError());
  std::size_t consumed = 0;
  const auto result = run.parser.parse("GET / HTTP/1.1\r\n\r\n", consumed);
  EXPECT_EQ(result.event, RequestParser::Event::Error);
  EXPECT_EQ(consumed, 0U);
}

}  // namespace keelson::http
