#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "keelson/http-header.hpp"

namespace keelson::http {

struct Version {
  uint8_t major;
  uint8_t minor;

  auto operator<=>(const Version&) const = default;
};

inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

// Request line and header fields of one request, as parsed from the wire.
class RequestHead {
 public:
  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // Raw request-target as received (path and optional query).
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  [[nodiscard]] std::string_view path() const noexcept;

  // Query string without the leading '?', empty if absent.
  [[nodiscard]] std::string_view query() const noexcept;

  [[nodiscard]] Version version() const noexcept { return _version; }

  [[nodiscard]] std::span<const Header> headers() const noexcept { return _headers; }

  // First value of the given header (case-insensitive name), if present.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return FindHeaderValue(_headers, name);
  }

  [[nodiscard]] bool isHead() const noexcept;

  // True if the client asked not to reuse the connection: "Connection: close", or HTTP/1.0 without
  // "Connection: keep-alive".
  [[nodiscard]] bool clientRequestsClose() const noexcept;

  // True for an HTTP/1.1 request carrying "Expect: 100-continue".
  [[nodiscard]] bool expectsContinue() const noexcept;

 private:
  friend class RequestParser;

  std::string _method;
  std::string _target;
  std::vector<Header> _headers;
  Version _version{HTTP_1_1};
};

}  // namespace keelson::http
