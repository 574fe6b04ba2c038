#pragma once

#include <string_view>

#include "keelson/http-status-code.hpp"

namespace keelson::http {

// Header names are stored in their canonical form for emission. Parsing code compares them case-insensitively.
// Token values (e.g. "chunked", "keep-alive") are lower case for the same reason.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";

inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Expect = "Expect";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Server = "Server";

inline constexpr std::string_view ConnectionClose = "close";
inline constexpr std::string_view ConnectionKeepAlive = "keep-alive";
inline constexpr std::string_view Chunked = "chunked";
inline constexpr std::string_view Expect100Continue = "100-continue";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";
inline constexpr std::string_view LastChunk = "0\r\n\r\n";
inline constexpr std::string_view Continue100Response = "HTTP/1.1 100 Continue\r\n\r\n";

constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeContinue:
      return "Continue";
    case StatusCodeSwitchingProtocols:
      return "Switching Protocols";
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeLengthRequired:
      return "Length Required";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeURITooLong:
      return "URI Too Long";
    case StatusCodeExpectationFailed:
      return "Expectation Failed";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return "";
  }
}

// 1xx, 204 and 304 responses never carry a body (RFC 9112 §6.3).
constexpr bool StatusForbidsBody(StatusCode status) noexcept {
  return (status >= 100 && status < 200) || status == StatusCodeNoContent || status == StatusCodeNotModified;
}

}  // namespace keelson::http
