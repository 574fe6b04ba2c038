#pragma once

#include <coroutine>
#include <utility>

namespace keelson {

// Single-shot wake-up primitive between a producer (transport callbacks, flow control) and one suspended consumer
// (an application coroutine waiting inside a request/response cycle).
//
// A Signal does not resume anybody by itself: set() only records the event, and the owner of the scheduling loop
// takes the waiter and resumes it. This keeps resumption on the loop stack and never inside the producer.
// All methods must be called from the thread running the owning connection.
class Signal {
 public:
  [[nodiscard]] bool isSet() const noexcept { return _set; }

  [[nodiscard]] bool isAwaited() const noexcept { return static_cast<bool>(_waiter); }

  // Registers the coroutine to wake. Returns false if the signal is already set, in which case the caller must not
  // suspend: the event it waits for already happened.
  bool registerWaiter(std::coroutine_handle<> waiter) noexcept {
    if (_set) {
      return false;
    }
    _waiter = waiter;
    return true;
  }

  // Idempotent.
  void set() noexcept { _set = true; }

  [[nodiscard]] std::coroutine_handle<> takeWaiter() noexcept { return std::exchange(_waiter, {}); }

  void reset() noexcept {
    _set = false;
    _waiter = {};
  }

 private:
  std::coroutine_handle<> _waiter;
  bool _set{false};
};

}  // namespace keelson
