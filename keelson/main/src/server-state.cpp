#include "keelson/server-state.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

#include "keelson/http-header.hpp"
#include "keelson/timedef.hpp"
#include "keelson/timestring.hpp"

namespace keelson {

ServerState::ServerState(std::vector<http::Header> defaultHeaders, bool addDateHeader)
    : _defaultHeaders(std::move(defaultHeaders)),
      _cachedSecond(std::numeric_limits<int64_t>::min()),
      _addDateHeader(addDateHeader) {}

std::string_view ServerState::currentDateHeader(SysTimePoint now) {
  const int64_t second = std::chrono::floor<std::chrono::seconds>(now).time_since_epoch().count();
  if (second != _cachedSecond) {
    TimeToStringRFC7231(now, _dateBuf.data());
    _cachedSecond = second;
    ++_dateRecomputations;
  }
  return {_dateBuf.data(), _dateBuf.size()};
}

}  // namespace keelson
