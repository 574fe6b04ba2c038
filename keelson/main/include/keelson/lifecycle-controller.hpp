#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>

#include "keelson/event-fd.hpp"

namespace keelson {

// Server lifecycle: NotStarted -> Starting -> Serving -> Stopping -> Stopped.
//
// Shutdown is event driven. requestShutdown() may be called from any thread: it moves to Stopping and wakes the
// event loop through wakeupFd(). The loop then shuts its connections down and reports each closure through
// onConnectionClosed(). When the last one is gone, completionFd() becomes readable and the loop calls finish().
class LifecycleController {
 public:
  enum class State : uint8_t { NotStarted, Starting, Serving, Stopping, Stopped };

  using Hook = std::function<void()>;

  LifecycleController() = default;

  LifecycleController(const LifecycleController&) = delete;
  LifecycleController& operator=(const LifecycleController&) = delete;

  [[nodiscard]] State state() const noexcept { return _state.load(std::memory_order_acquire); }

  // Called once during startup, before serving. Throwing aborts the startup.
  void setStartupHook(Hook hook) { _startupHook = std::move(hook); }

  // Called once when the server stops, unless the stop is forced.
  void setShutdownHook(Hook hook) { _shutdownHook = std::move(hook); }

  // Runs the startup hook and enters Serving. If the hook throws, enters Stopped and throws std::runtime_error.
  void startup();

  // Thread safe. Returns true if this call initiated the shutdown. A forced request escalates a shutdown already in
  // progress. A zero grace period means no limit.
  bool requestShutdown(std::chrono::milliseconds gracePeriod = std::chrono::milliseconds{0}, bool force = false);

  [[nodiscard]] bool isShutdownRequested() const noexcept { return state() >= State::Stopping; }

  [[nodiscard]] bool isForceRequested() const noexcept { return _forceRequested.load(std::memory_order_acquire); }

  [[nodiscard]] std::chrono::milliseconds gracePeriod() const noexcept {
    return std::chrono::milliseconds{_gracePeriodMs.load(std::memory_order_acquire)};
  }

  // Reports the number of connections still open after one closed (or when the shutdown starts).
  void onConnectionClosed(std::size_t remaining);

  [[nodiscard]] int wakeupFd() const noexcept { return _wakeupFd.fd(); }

  [[nodiscard]] int completionFd() const noexcept { return _completionFd.fd(); }

  void consumeWakeup() const noexcept { _wakeupFd.drain(); }

  // Enters Stopped. Runs the shutdown hook unless forced, logging its errors.
  void finish(bool forced);

  // Blocks until Stopped or the timeout elapsed. Returns true if Stopped.
  bool waitUntilStopped(std::chrono::milliseconds timeout) const;

 private:
  void enter(State state);

  Hook _startupHook;
  Hook _shutdownHook;
  EventFd _wakeupFd;
  EventFd _completionFd;
  mutable std::mutex _mutex;
  mutable std::condition_variable _stoppedCv;
  std::atomic<int64_t> _gracePeriodMs{0};
  std::atomic<State> _state{State::NotStarted};
  std::atomic<bool> _forceRequested{false};
  std::atomic<bool> _completionSent{false};
  std::atomic<bool> _pendingShutdown{false};
};

std::string_view LifecycleStateName(LifecycleController::State state) noexcept;

}  // namespace keelson
