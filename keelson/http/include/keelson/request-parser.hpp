#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "keelson/http-request-head.hpp"
#include "keelson/http-status-code.hpp"

namespace keelson::http {

// Incremental HTTP/1.1 request parser.
//
// The caller owns the input buffer. parse() examines a prefix of it, reports one event and the number of bytes the
// caller must discard. Partial lines are never consumed, so the caller simply appends new bytes and calls again.
// BodyData events point into the caller's buffer and must be copied before discarding.
//
// Message framing follows RFC 9112 §6: Transfer-Encoding (chunked only) or Content-Length, otherwise no body.
class RequestParser {
 public:
  enum class State : uint8_t {
    RequestLine,
    Headers,
    FixedBody,
    ChunkSize,
    ChunkData,
    ChunkDataEnd,
    Trailers,
    Done,  // message fully parsed, MessageComplete not yet reported
    Error
  };

  enum class Event : uint8_t { NeedMore, HeadComplete, BodyData, MessageComplete, Error };

  struct Result {
    Event event;
    std::string_view data;  // BodyData only
    StatusCode errorStatus{};
  };

  struct Limits {
    std::size_t maxHeaderBytes;
    std::size_t maxBodyBytes;
  };

  explicit RequestParser(Limits limits) noexcept : _limits(limits) {}

  Result parse(std::string_view input, std::size_t& consumed);

  [[nodiscard]] State state() const noexcept { return _state; }

  // True between messages: nothing of the next request has been consumed yet.
  [[nodiscard]] bool atMessageBoundary() const noexcept { return _state == State::RequestLine; }

  [[nodiscard]] bool hasError() const noexcept { return _state == State::Error; }

  [[nodiscard]] bool isChunked() const noexcept { return _chunked; }

  // Moves out the head after HeadComplete was reported.
  RequestHead takeHead() noexcept;

 private:
  Result fail(StatusCode status, std::string_view reason);

  Result parseRequestLine(std::string_view line);
  Result parseHeaderLine(std::string_view line);
  Result completeHead();
  Result parseChunkSize(std::string_view line);

  void resetMessage() noexcept;

  Limits _limits;
  RequestHead _head;
  std::size_t _headBytes{};
  std::size_t _bodyBytes{};
  std::size_t _remaining{};  // bytes left in fixed body or current chunk
  State _state{State::RequestLine};
  bool _chunked{};
};

}  // namespace keelson::http
