#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "keelson/http-header.hpp"
#include "keelson/timedef.hpp"
#include "keelson/timestring.hpp"

namespace keelson {

// State shared by all connections of one server: connection and request counters and the cached Date header value.
//
// Counters are atomic so that they can be read from any thread (monitoring, tests). The Date cache belongs to the
// event loop thread.
class ServerState {
 public:
  ServerState(std::vector<http::Header> defaultHeaders, bool addDateHeader);

  ServerState(const ServerState&) = delete;
  ServerState& operator=(const ServerState&) = delete;

  void onConnectionOpened() noexcept { _activeConnections.fetch_add(1, std::memory_order_relaxed); }

  void onConnectionClosed() noexcept { _activeConnections.fetch_sub(1, std::memory_order_relaxed); }

  void onRequestServed() noexcept { _totalRequests.fetch_add(1, std::memory_order_relaxed); }

  [[nodiscard]] uint64_t activeConnections() const noexcept {
    return _activeConnections.load(std::memory_order_relaxed);
  }

  [[nodiscard]] uint64_t totalRequests() const noexcept { return _totalRequests.load(std::memory_order_relaxed); }

  // RFC 7231 formatted current time. The returned view stays valid, and unchanged, until the wall clock second
  // advances: every call within the same second returns the same characters from the same buffer.
  [[nodiscard]] std::string_view currentDateHeader() { return currentDateHeader(SysClock::now()); }

  [[nodiscard]] std::string_view currentDateHeader(SysTimePoint now);

  // Number of times the Date value was formatted.
  [[nodiscard]] uint64_t dateRecomputations() const noexcept { return _dateRecomputations; }

  [[nodiscard]] std::span<const http::Header> defaultHeaders() const noexcept { return _defaultHeaders; }

  [[nodiscard]] bool addDateHeader() const noexcept { return _addDateHeader; }

 private:
  std::vector<http::Header> _defaultHeaders;
  std::atomic<uint64_t> _activeConnections{0};
  std::atomic<uint64_t> _totalRequests{0};
  int64_t _cachedSecond;
  uint64_t _dateRecomputations{};
  std::array<char, kRFC7231DateStrLen> _dateBuf{};
  bool _addDateHeader;
};

}  // namespace keelson
