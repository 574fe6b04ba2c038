#include "keelson/request-parser.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include "keelson/http-constants.hpp"
#include "keelson/http-header.hpp"
#include "keelson/http-request-head.hpp"
#include "keelson/http-status-code.hpp"
#include "keelson/log.hpp"
#include "keelson/simple-charconv.hpp"
#include "keelson/string-equal-ignore-case.hpp"

namespace keelson::http {

namespace {

// Chunk size lines carry at most a hex number plus extensions.
constexpr std::size_t kMaxChunkSizeLineLength = 1024;

// Returns the position of the first '\n' and the line without its terminator (CRLF or bare LF).
std::optional<std::pair<std::string_view, std::size_t>> NextLine(std::string_view input) {
  const auto lfPos = input.find('\n');
  if (lfPos == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view line = input.substr(0, lfPos);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return std::make_pair(line, lfPos + 1);
}

}  // namespace

RequestParser::Result RequestParser::fail(StatusCode status, std::string_view reason) {
  log::warn("Invalid HTTP request ({}): {}", status, reason);
  _state = State::Error;
  return {Event::Error, {}, status};
}

RequestHead RequestParser::takeHead() noexcept { return std::exchange(_head, RequestHead{}); }

void RequestParser::resetMessage() noexcept {
  _headBytes = 0;
  _bodyBytes = 0;
  _remaining = 0;
  _chunked = false;
  _state = State::RequestLine;
}

RequestParser::Result RequestParser::parse(std::string_view input, std::size_t& consumed) {
  consumed = 0;
  while (true) {
    const std::string_view rest = input.substr(consumed);
    switch (_state) {
      case State::RequestLine: {
        // RFC 9112 §2.2: ignore empty lines received before the request-line.
        std::size_t nbLeading = 0;
        while (nbLeading < rest.size() && (rest[nbLeading] == '\r' || rest[nbLeading] == '\n')) {
          ++nbLeading;
        }
        consumed += nbLeading;
        const auto line = NextLine(rest.substr(nbLeading));
        if (!line) {
          if (rest.size() - nbLeading > _limits.maxHeaderBytes) {
            return fail(StatusCodeRequestHeaderFieldsTooLarge, "request line too long");
          }
          return {Event::NeedMore};
        }
        _headBytes = line->second;
        if (_headBytes > _limits.maxHeaderBytes) {
          return fail(StatusCodeRequestHeaderFieldsTooLarge, "request line too long");
        }
        const Result result = parseRequestLine(line->first);
        if (result.event == Event::Error) {
          return result;
        }
        consumed += line->second;
        _state = State::Headers;
        break;
      }
      case State::Headers: {
        const auto line = NextLine(rest);
        if (!line) {
          if (_headBytes + rest.size() > _limits.maxHeaderBytes) {
            return fail(StatusCodeRequestHeaderFieldsTooLarge, "headers too large");
          }
          return {Event::NeedMore};
        }
        _headBytes += line->second;
        if (_headBytes > _limits.maxHeaderBytes) {
          return fail(StatusCodeRequestHeaderFieldsTooLarge, "headers too large");
        }
        consumed += line->second;
        if (line->first.empty()) {
          return completeHead();
        }
        const Result result = parseHeaderLine(line->first);
        if (result.event == Event::Error) {
          return result;
        }
        break;
      }
      case State::FixedBody:
        [[fallthrough]];
      case State::ChunkData: {
        if (rest.empty()) {
          return {Event::NeedMore};
        }
        const std::size_t nbBytes = std::min(rest.size(), _remaining);
        _remaining -= nbBytes;
        consumed += nbBytes;
        if (_remaining == 0) {
          _state = _state == State::FixedBody ? State::Done : State::ChunkDataEnd;
        }
        return {Event::BodyData, rest.substr(0, nbBytes)};
      }
      case State::ChunkSize: {
        const auto line = NextLine(rest);
        if (!line) {
          if (rest.size() > kMaxChunkSizeLineLength) {
            return fail(StatusCodeBadRequest, "chunk size line too long");
          }
          return {Event::NeedMore};
        }
        const Result result = parseChunkSize(line->first);
        if (result.event == Event::Error) {
          return result;
        }
        consumed += line->second;
        break;
      }
      case State::ChunkDataEnd: {
        if (rest.empty() || (rest.size() == 1 && rest[0] == '\r')) {
          return {Event::NeedMore};
        }
        if (rest.starts_with(CRLF)) {
          consumed += CRLF.size();
        } else if (rest[0] == '\n') {
          consumed += 1;
        } else {
          return fail(StatusCodeBadRequest, "missing CRLF after chunk data");
        }
        _state = State::ChunkSize;
        break;
      }
      case State::Trailers: {
        const auto line = NextLine(rest);
        if (!line) {
          if (_headBytes + rest.size() > _limits.maxHeaderBytes) {
            return fail(StatusCodeRequestHeaderFieldsTooLarge, "trailers too large");
          }
          return {Event::NeedMore};
        }
        _headBytes += line->second;
        consumed += line->second;
        if (line->first.empty()) {
          _state = State::Done;
        } else if (_headBytes > _limits.maxHeaderBytes) {
          return fail(StatusCodeRequestHeaderFieldsTooLarge, "trailers too large");
        }
        // Trailer fields are accepted and discarded.
        break;
      }
      case State::Done:
        resetMessage();
        return {Event::MessageComplete};
      case State::Error:
        return {Event::Error, {}, StatusCodeBadRequest};
    }
  }
}

RequestParser::Result RequestParser::parseRequestLine(std::string_view line) {
  const auto firstSp = line.find(' ');
  if (firstSp == std::string_view::npos) {
    return fail(StatusCodeBadRequest, "malformed request line");
  }
  const auto secondSp = line.find(' ', firstSp + 1);
  if (secondSp == std::string_view::npos || line.find(' ', secondSp + 1) != std::string_view::npos) {
    return fail(StatusCodeBadRequest, "malformed request line");
  }
  const std::string_view method = line.substr(0, firstSp);
  const std::string_view target = line.substr(firstSp + 1, secondSp - firstSp - 1);
  const std::string_view version = line.substr(secondSp + 1);

  if (!IsValidToken(method)) {
    return fail(StatusCodeBadRequest, "invalid method");
  }
  if (target.empty() || !IsValidHeaderValue(target)) {
    return fail(StatusCodeBadRequest, "invalid request target");
  }
  if (version.size() != HTTP11Sv.size() || !version.starts_with("HTTP/") || version[6] != '.' ||
      version[5] < '0' || version[5] > '9' || version[7] < '0' || version[7] > '9') {
    return fail(StatusCodeBadRequest, "invalid HTTP version");
  }
  if (version != HTTP11Sv && version != HTTP10Sv) {
    return fail(StatusCodeHTTPVersionNotSupported, "unsupported HTTP version");
  }

  _head._headers.clear();
  _head._method = method;
  _head._target = target;
  _head._version = version == HTTP11Sv ? HTTP_1_1 : HTTP_1_0;
  return {Event::NeedMore};
}

RequestParser::Result RequestParser::parseHeaderLine(std::string_view line) {
  if (line.front() == ' ' || line.front() == '\t') {
    return fail(StatusCodeBadRequest, "obsolete header line folding");
  }
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos) {
    return fail(StatusCodeBadRequest, "header line without colon");
  }
  const std::string_view name = line.substr(0, colonPos);
  const std::string_view value = TrimOws(line.substr(colonPos + 1));
  if (!IsValidToken(name)) {
    return fail(StatusCodeBadRequest, "invalid header name");
  }
  if (!IsValidHeaderValue(value)) {
    return fail(StatusCodeBadRequest, "invalid header value");
  }
  _head._headers.push_back(Header{std::string(name), std::string(value)});
  return {Event::NeedMore};
}

RequestParser::Result RequestParser::completeHead() {
  std::optional<std::string_view> transferEncoding;
  std::optional<std::size_t> contentLength;
  for (const Header& header : _head._headers) {
    if (CaseInsensitiveEqual(header.name, TransferEncoding)) {
      if (transferEncoding) {
        return fail(StatusCodeBadRequest, "multiple Transfer-Encoding headers");
      }
      transferEncoding = header.value;
    } else if (CaseInsensitiveEqual(header.name, ContentLength)) {
      const auto value = ParseUnsigned(header.value);
      if (!value) {
        return fail(StatusCodeBadRequest, "invalid Content-Length");
      }
      if (contentLength && *contentLength != *value) {
        return fail(StatusCodeBadRequest, "conflicting Content-Length values");
      }
      contentLength = value;
    }
  }

  if (transferEncoding) {
    if (contentLength) {
      return fail(StatusCodeBadRequest, "both Content-Length and Transfer-Encoding");
    }
    if (_head._version < HTTP_1_1) {
      return fail(StatusCodeBadRequest, "Transfer-Encoding in HTTP/1.0 request");
    }
    if (!CaseInsensitiveEqual(*transferEncoding, Chunked)) {
      return fail(StatusCodeNotImplemented, "unsupported Transfer-Encoding");
    }
    _chunked = true;
    _state = State::ChunkSize;
  } else if (contentLength && *contentLength != 0) {
    if (*contentLength > _limits.maxBodyBytes) {
      return fail(StatusCodePayloadTooLarge, "Content-Length exceeds body limit");
    }
    _remaining = *contentLength;
    _state = State::FixedBody;
  } else {
    _state = State::Done;
  }
  return {Event::HeadComplete};
}

RequestParser::Result RequestParser::parseChunkSize(std::string_view line) {
  const std::string_view sizeStr = TrimOws(line.substr(0, line.find(';')));
  const auto chunkSize = ParseUnsigned(sizeStr, 16U);
  if (!chunkSize) {
    return fail(StatusCodeBadRequest, "invalid chunk size");
  }
  if (*chunkSize > _limits.maxBodyBytes - std::min(_bodyBytes, _limits.maxBodyBytes)) {
    return fail(StatusCodePayloadTooLarge, "chunked body exceeds body limit");
  }
  _bodyBytes += *chunkSize;
  if (*chunkSize == 0) {
    _state = State::Trailers;
  } else {
    _remaining = *chunkSize;
    _state = State::ChunkData;
  }
  return {Event::NeedMore};
}

}  // namespace keelson::http
