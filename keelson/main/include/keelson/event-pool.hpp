#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "keelson/signal.hpp"

namespace keelson {

// Bounded free-list of Signal objects, shared by all connections of a server.
//
// acquire() hands out exclusive ownership of a reset signal, reusing the most recently released one when available.
// release() gives it back: a signal that is set while a coroutine is still registered on it belongs to an unfinished
// wait and is discarded instead of being recycled. Idle signals beyond the capacity are discarded as well, so the
// pool never retains more than capacity() idle entries. A capacity of 0 disables pooling.
class EventPool {
 public:
  static constexpr std::size_t kDefaultCapacity = 1000;

  struct Stats {
    uint64_t hits;
    uint64_t misses;
    uint64_t discards;
  };

  explicit EventPool(std::size_t capacity = kDefaultCapacity);

  EventPool(const EventPool&) = delete;
  EventPool& operator=(const EventPool&) = delete;

  [[nodiscard]] std::unique_ptr<Signal> acquire();

  void release(std::unique_ptr<Signal> signal);

  [[nodiscard]] std::size_t idleCount() const;

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  [[nodiscard]] Stats stats() const;

 private:
  mutable std::mutex _mutex;
  std::vector<std::unique_ptr<Signal>> _idle;
  Stats _stats{};
  std::size_t _capacity;
};

}  // namespace keelson
