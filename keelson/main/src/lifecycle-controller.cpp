#include "keelson/lifecycle-controller.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "keelson/log.hpp"

namespace keelson {

std::string_view LifecycleStateName(LifecycleController::State state) noexcept {
  switch (state) {
    case LifecycleController::State::NotStarted:
      return "NotStarted";
    case LifecycleController::State::Starting:
      return "Starting";
    case LifecycleController::State::Serving:
      return "Serving";
    case LifecycleController::State::Stopping:
      return "Stopping";
    case LifecycleController::State::Stopped:
      return "Stopped";
    default:
      return "Unknown";
  }
}

void LifecycleController::enter(State state) {
  {
    std::scoped_lock lock(_mutex);
    log::trace("Lifecycle {} -> {}", LifecycleStateName(_state.load()), LifecycleStateName(state));
    _state.store(state, std::memory_order_release);
  }
  if (state == State::Stopped) {
    _stoppedCv.notify_all();
  }
}

void LifecycleController::startup() {
  State expected = State::NotStarted;
  if (!_state.compare_exchange_strong(expected, State::Starting)) {
    throw std::logic_error("Server lifecycle already started");
  }
  log::info("Waiting for application startup");
  if (_startupHook) {
    try {
      _startupHook();
    } catch (const std::exception& ex) {
      log::error("Application startup failed: {}", ex.what());
      enter(State::Stopped);
      throw std::runtime_error(std::string("Application startup failed: ") + ex.what());
    }
  }
  enter(State::Serving);
  log::info("Application startup complete");
  if (_pendingShutdown.load(std::memory_order_acquire)) {
    expected = State::Serving;
    _state.compare_exchange_strong(expected, State::Stopping);
  }
}

bool LifecycleController::requestShutdown(std::chrono::milliseconds gracePeriod, bool force) {
  if (force) {
    _forceRequested.store(true, std::memory_order_release);
  }
  _gracePeriodMs.store(gracePeriod.count(), std::memory_order_release);

  bool initiated = false;
  State current = _state.load(std::memory_order_acquire);
  if (current == State::NotStarted || current == State::Starting) {
    // Recorded for startup(), which enters Stopping instead of Serving.
    initiated = !_pendingShutdown.exchange(true);
    current = _state.load(std::memory_order_acquire);
  }
  while (current == State::Serving) {
    if (_state.compare_exchange_weak(current, State::Stopping)) {
      initiated = true;
      break;
    }
  }
  _wakeupFd.notify();
  return initiated;
}

void LifecycleController::onConnectionClosed(std::size_t remaining) {
  if (remaining == 0 && state() == State::Stopping && !_completionSent.exchange(true)) {
    _completionFd.notify();
  }
}

void LifecycleController::finish(bool forced) {
  if (state() == State::Stopped) {
    return;
  }
  _completionFd.drain();
  if (forced) {
    log::warn("Forced shutdown, skipping application shutdown");
  } else if (_shutdownHook) {
    log::info("Waiting for application shutdown");
    try {
      _shutdownHook();
      log::info("Application shutdown complete");
    } catch (const std::exception& ex) {
      log::error("Application shutdown failed: {}", ex.what());
    }
  }
  enter(State::Stopped);
}

bool LifecycleController::waitUntilStopped(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(_mutex);
  return _stoppedCv.wait_for(lock, timeout, [this] { return _state.load() == State::Stopped; });
}

}  // namespace keelson
