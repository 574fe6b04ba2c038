#include "keelson/simple-charconv.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string_view>

namespace keelson {

std::optional<std::size_t> ParseUnsigned(std::string_view str, unsigned base) noexcept {
  if (str.empty()) {
    return std::nullopt;
  }
  static constexpr std::size_t kMax = std::numeric_limits<std::size_t>::max();
  std::size_t value = 0;
  for (char ch : str) {
    unsigned digit;
    if (ch >= '0' && ch <= '9') {
      digit = static_cast<unsigned>(ch - '0');
    } else if (base == 16U && ch >= 'a' && ch <= 'f') {
      digit = static_cast<unsigned>(ch - 'a') + 10U;
    } else if (base == 16U && ch >= 'A' && ch <= 'F') {
      digit = static_cast<unsigned>(ch - 'A') + 10U;
    } else {
      return std::nullopt;
    }
    if (value > (kMax - digit) / base) {
      return std::nullopt;
    }
    value = (value * base) + digit;
  }
  return value;
}

}  // namespace keelson
