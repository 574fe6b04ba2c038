#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "keelson/http-header.hpp"
#include "keelson/http-status-code.hpp"

namespace keelson::http {

// Status line and header fields of a response, as produced by the application.
// Framing headers (Content-Length / Transfer-Encoding / Connection) may be set by the application; the server adds
// whatever is missing when the head is written.
class ResponseHead {
 public:
  explicit ResponseHead(StatusCode status = StatusCodeOK) noexcept : _status(status) {}

  ResponseHead& status(StatusCode status) noexcept {
    _status = status;
    return *this;
  }

  // Overrides the standard reason phrase.
  ResponseHead& reason(std::string_view reason) {
    _reason.assign(reason);
    return *this;
  }

  // Appends a header field. Names and values are validated when the head is written.
  ResponseHead& header(std::string_view name, std::string_view value) {
    _headers.push_back(Header{std::string(name), std::string(value)});
    return *this;
  }

  [[nodiscard]] StatusCode status() const noexcept { return _status; }

  // Custom reason if set, otherwise the standard one for the status.
  [[nodiscard]] std::string_view reason() const noexcept;

  [[nodiscard]] std::span<const Header> headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return FindHeaderValue(_headers, name);
  }

 private:
  std::string _reason;
  std::vector<Header> _headers;
  StatusCode _status;
};

// Wire serialization helpers shared by the response writer and error responses.

// "HTTP/1.1 <status> <reason>\r\n"
void AppendStatusLine(std::string& out, StatusCode status, std::string_view reason);

// "<name>: <value>\r\n"
void AppendHeader(std::string& out, std::string_view name, std::string_view value);

// One chunk of the chunked transfer coding. An empty data appends nothing (the last chunk is written separately).
void AppendChunk(std::string& out, std::string_view data);

// Complete short response with a text body and "Connection: close", used for errors emitted by the server itself.
// date may be empty to omit the Date header.
std::string BuildSimpleResponse(StatusCode status, std::span<const Header> defaultHeaders, std::string_view date,
                                std::string_view body = {});

}  // namespace keelson::http
