#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace keelson::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const = default;
};

// RFC 7230 §3.2.6 token characters.
constexpr bool IsTChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

bool IsValidToken(std::string_view token) noexcept;

// Header values must not contain CR, LF or NUL. The empty value is allowed.
bool IsValidHeaderValue(std::string_view value) noexcept;

// Value of the first header named name (case-insensitive), if any.
std::optional<std::string_view> FindHeaderValue(std::span<const Header> headers, std::string_view name) noexcept;

}  // namespace keelson::http
