#include "keelson/timestring.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <utility>

#include "keelson/simple-charconv.hpp"
#include "keelson/timedef.hpp"

namespace keelson {

namespace {

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool IsSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

}  // namespace

SysTimePoint TryParseTimeRFC7231(std::string_view value) {
  while (!value.empty() && IsSpace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && IsSpace(value.back())) {
    value.remove_suffix(1);
  }
  if (std::cmp_not_equal(value.size(), kRFC7231DateStrLen)) {
    return kInvalidTimePoint;
  }

  const char* ptr = value.data();
  if (ptr[3] != ',' || ptr[4] != ' ' || ptr[7] != ' ' || ptr[11] != ' ' || ptr[16] != ' ' || ptr[19] != ':' ||
      ptr[22] != ':' || ptr[25] != ' ') {
    return kInvalidTimePoint;
  }
  static constexpr int kDigitPositions[] = {5, 6, 12, 13, 14, 15, 17, 18, 20, 21, 23, 24};
  if (!std::ranges::all_of(kDigitPositions, [ptr](int pos) { return IsDigit(ptr[pos]); })) {
    return kInvalidTimePoint;
  }
  if (pack3(ptr + 26) != pack3("GMT")) {
    return kInvalidTimePoint;
  }

  static constexpr uint32_t kMonths[]{
      pack3("Jan"), pack3("Feb"), pack3("Mar"), pack3("Apr"), pack3("May"), pack3("Jun"),
      pack3("Jul"), pack3("Aug"), pack3("Sep"), pack3("Oct"), pack3("Nov"), pack3("Dec"),
  };
  static constexpr uint32_t kWeekdays[]{pack3("Sun"), pack3("Mon"), pack3("Tue"), pack3("Wed"),
                                        pack3("Thu"), pack3("Fri"), pack3("Sat")};

  const auto monthIt = std::ranges::find(kMonths, pack3(ptr + 8));
  const auto weekdayIt = std::ranges::find(kWeekdays, pack3(ptr));
  if (monthIt == std::end(kMonths) || weekdayIt == std::end(kWeekdays)) {
    return kInvalidTimePoint;
  }

  const int hourValue = read2(ptr + 17);
  const int minuteValue = read2(ptr + 20);
  const int secondValue = read2(ptr + 23);
  if (hourValue > 23 || minuteValue > 59 || secondValue > 60) {
    return kInvalidTimePoint;
  }

  const std::chrono::year_month_day ymd{
      std::chrono::year{read4(ptr + 12)},
      std::chrono::month{static_cast<unsigned>(std::distance(std::begin(kMonths), monthIt)) + 1U},
      std::chrono::day{static_cast<unsigned>(read2(ptr + 5))}};
  if (!ymd.ok()) {
    return kInvalidTimePoint;
  }
  const std::chrono::sys_days dayPoint{ymd};
  if (std::chrono::weekday{dayPoint}.c_encoding() !=
      static_cast<unsigned>(std::distance(std::begin(kWeekdays), weekdayIt))) {
    return kInvalidTimePoint;
  }
  return dayPoint + std::chrono::hours{hourValue} + std::chrono::minutes{minuteValue} +
         std::chrono::seconds{secondValue};
}

}  // namespace keelson
