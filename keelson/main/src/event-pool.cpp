#include "keelson/event-pool.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

#include "keelson/log.hpp"
#include "keelson/signal.hpp"

namespace keelson {

EventPool::EventPool(std::size_t capacity) : _capacity(capacity) {
  // Pre-reserve a reasonable portion only, the pool grows with the observed concurrency.
  _idle.reserve(std::min<std::size_t>(_capacity, 64));
}

std::unique_ptr<Signal> EventPool::acquire() {
  {
    std::scoped_lock lock(_mutex);
    if (!_idle.empty()) {
      ++_stats.hits;
      auto signal = std::move(_idle.back());
      _idle.pop_back();
      return signal;
    }
    ++_stats.misses;
  }
  return std::make_unique<Signal>();
}

void EventPool::release(std::unique_ptr<Signal> signal) {
  if (!signal) {
    return;
  }
  std::scoped_lock lock(_mutex);
  if (signal->isSet() && signal->isAwaited()) {
    log::trace("Discarding signal released while still awaited");
    ++_stats.discards;
    return;
  }
  if (_idle.size() >= _capacity) {
    ++_stats.discards;
    return;
  }
  signal->reset();
  _idle.push_back(std::move(signal));
}

std::size_t EventPool::idleCount() const {
  std::scoped_lock lock(_mutex);
  return _idle.size();
}

EventPool::Stats EventPool::stats() const {
  std::scoped_lock lock(_mutex);
  return _stats;
}

}  // namespace keelson
