#pragma once

#include <coroutine>
#include <exception>
#include <utility>

namespace keelson {

// Coroutine return type of applications.
//
// The coroutine starts suspended: the connection that owns the exchange resumes it from its event loop, and again
// each time one of the awaited cycle operations becomes ready. The application may also await anything else, as long
// as it is resumed on the loop thread (see HttpServer::post). An exception escaping the coroutine body is captured
// and rethrown by rethrowIfFailed() once the task is done.
class RequestTask {
 public:
  // Called when the coroutine reaches its final suspension point, whoever resumed it last.
  // The callback may destroy the task.
  using FinishCallback = void (*)(void* context) noexcept;

  struct promise_type {
    struct FinalAwaiter {
      bool await_ready() const noexcept { return false; }

      void await_suspend(std::coroutine_handle<promise_type> handle) const noexcept {
        const FinishCallback onFinish = handle.promise()._onFinish;
        void* context = handle.promise()._finishContext;
        if (onFinish != nullptr) {
          // The frame may be gone after this call.
          onFinish(context);
        }
      }

      void await_resume() const noexcept {}
    };

    RequestTask get_return_object() noexcept {
      return RequestTask{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }
    FinalAwaiter final_suspend() noexcept { return {}; }

    void return_void() const noexcept {}
    void unhandled_exception() noexcept { _exception = std::current_exception(); }

    std::exception_ptr _exception;
    FinishCallback _onFinish{nullptr};
    void* _finishContext{nullptr};
  };

  RequestTask() noexcept = default;
  explicit RequestTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  RequestTask(RequestTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  RequestTask& operator=(RequestTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  RequestTask(const RequestTask&) = delete;
  RequestTask& operator=(const RequestTask&) = delete;

  ~RequestTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  void resume() {
    if (_coro && !_coro.done()) {
      _coro.resume();
    }
  }

  void setFinishCallback(FinishCallback onFinish, void* context) noexcept {
    if (_coro) {
      _coro.promise()._onFinish = onFinish;
      _coro.promise()._finishContext = context;
    }
  }

  void rethrowIfFailed() const {
    if (_coro && _coro.promise()._exception) {
      std::rethrow_exception(_coro.promise()._exception);
    }
  }

  // Destroys the coroutine frame, wherever it is suspended.
  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace keelson
