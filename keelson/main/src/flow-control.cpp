#include "keelson/flow-control.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

#include "keelson/log.hpp"
#include "keelson/signal.hpp"

namespace keelson {

FlowControlManager::FlowControlManager(std::size_t lowWatermark, std::size_t highWatermark)
    : _lowWatermark(lowWatermark), _highWatermark(highWatermark) {
  if (lowWatermark >= highWatermark) {
    throw std::invalid_argument("Flow control low watermark must be strictly lower than the high watermark");
  }
}

void FlowControlManager::onBytesQueued(std::size_t nbBytes) {
  _queuedBytes += nbBytes;
  if (_queuedBytes > _highWatermark) {
    pause();
  }
}

void FlowControlManager::onBytesDrained(std::size_t nbBytes) {
  _queuedBytes -= std::min(nbBytes, _queuedBytes);
  if (_queuedBytes <= _lowWatermark) {
    resume();
  }
}

bool FlowControlManager::pause() {
  if (_paused) {
    return false;
  }
  _paused = true;
  ++_pauseCount;
  log::trace("Flow control paused with {} queued bytes", _queuedBytes);
  return true;
}

bool FlowControlManager::resume() {
  if (!_paused) {
    return false;
  }
  _paused = false;
  ++_resumeCount;
  for (Signal* waiter : _waiters) {
    waiter->set();
  }
  log::trace("Flow control resumed with {} queued bytes, waking {} waiter(s)", _queuedBytes, _waiters.size());
  _waiters.clear();
  return true;
}

void FlowControlManager::addWaiter(Signal& signal) {
  if (!_paused) {
    signal.set();
    return;
  }
  if (std::ranges::find(_waiters, &signal) == _waiters.end()) {
    _waiters.push_back(&signal);
  }
}

void FlowControlManager::removeWaiter(const Signal& signal) noexcept {
  std::erase(_waiters, &signal);
}

}  // namespace keelson
