#pragma once

#include <string_view>

namespace keelson {

constexpr char tolower(char ch) noexcept { return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch + ('a' - 'A')) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr std::string_view TrimOws(std::string_view value) noexcept {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }
  return value;
}

// Tells whether a comma separated header value (e.g. "keep-alive, Upgrade") contains token, ignoring case.
constexpr bool ContainsTokenIgnoreCase(std::string_view list, std::string_view token) noexcept {
  while (!list.empty()) {
    const auto commaPos = list.find(',');
    const std::string_view item = TrimOws(list.substr(0, commaPos));
    if (CaseInsensitiveEqual(item, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace keelson
