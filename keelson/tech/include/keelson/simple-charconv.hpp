#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace keelson {

// Fixed-width decimal writers. Values must fit in the requested number of digits.
constexpr auto write2(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

constexpr auto write4(auto buf, std::integral auto value) {
  *buf = static_cast<char>('0' + (value / 1000));
  *++buf = static_cast<char>('0' + ((value / 100) % 10));
  *++buf = static_cast<char>('0' + ((value / 10) % 10));
  *++buf = static_cast<char>('0' + (value % 10));
  return ++buf;
}

// Copy exactly 3 chars from a source known to have at least 3 chars.
constexpr auto copy3(auto des, auto src) {
  *des = src[0];
  *++des = src[1];
  *++des = src[2];
  return ++des;
}

constexpr int read2(const char* ptr) { return ((ptr[0] - '0') * 10) + (ptr[1] - '0'); }

constexpr int read4(const char* ptr) {
  return ((ptr[0] - '0') * 1000) + ((ptr[1] - '0') * 100) + ((ptr[2] - '0') * 10) + (ptr[3] - '0');
}

// Packs 3 chars into an integer, used to compare short tokens (month and weekday names).
constexpr uint32_t pack3(const char* ptr) {
  return (static_cast<uint32_t>(static_cast<unsigned char>(ptr[0])) << 16) |
         (static_cast<uint32_t>(static_cast<unsigned char>(ptr[1])) << 8) |
         static_cast<uint32_t>(static_cast<unsigned char>(ptr[2]));
}

// Number of hexadecimal digits needed to represent value (at least 1).
constexpr std::size_t nchars_hex(std::size_t value) {
  std::size_t nbDigits = 1;
  while (value >= 16U) {
    value /= 16U;
    ++nbDigits;
  }
  return nbDigits;
}

// Writes value in lower case hexadecimal and returns a pointer past the last written char.
constexpr char* write_hex(char* buf, std::size_t value) {
  const auto nbDigits = nchars_hex(value);
  char* end = buf + nbDigits;
  char* out = end;
  do {
    *--out = "0123456789abcdef"[value % 16U];
    value /= 16U;
  } while (value != 0);
  return end;
}

// Strict parse of a non-empty unsigned decimal or hexadecimal number. Returns std::nullopt on any invalid char or
// overflow.
std::optional<std::size_t> ParseUnsigned(std::string_view str, unsigned base = 10U) noexcept;

}  // namespace keelson
