#include "keelson/http-header.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <string_view>

#include "keelson/string-equal-ignore-case.hpp"

namespace keelson::http {

bool IsValidToken(std::string_view token) noexcept {
  return !token.empty() && std::ranges::all_of(token, [](char ch) { return IsTChar(ch); });
}

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::none_of(value, [](char ch) { return ch == '\r' || ch == '\n' || ch == '\0'; });
}

std::optional<std::string_view> FindHeaderValue(std::span<const Header> headers, std::string_view name) noexcept {
  const auto it = std::ranges::find_if(headers, [name](const Header& header) {
    return CaseInsensitiveEqual(header.name, name);
  });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

}  // namespace keelson::http
