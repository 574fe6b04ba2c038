#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "keelson/http-request-head.hpp"
#include "keelson/http-response-head.hpp"
#include "keelson/http-status-code.hpp"
#include "keelson/request-task.hpp"
#include "keelson/signal.hpp"

namespace keelson {

class ConnectionHandler;
class RequestResponseCycle;

// The application: called once per request, its coroutine drives the exchange through the cycle operations.
using Application = std::function<RequestTask(RequestResponseCycle&)>;

// Misuse of the response API by the application (double start, body before start, data after completion, body not
// matching its declared Content-Length, invalid status or header). Fatal for the exchange.
class ResponseProtocolError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// Thrown when the application keeps sending after it was already told that the client disconnected.
class ClientDisconnected : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct BodyEvent {
  enum class Type : uint8_t { Chunk, End, Disconnect };

  Type type;
  std::string data;  // Chunk only
};

enum class SendStatus : uint8_t { Ok, Disconnected };

// Terminal event of an exchange, observed by the connection to decide between keep-alive and close.
enum class CycleOutcome : uint8_t { Pending, Completed, AppError, Disconnected };

// One HTTP request / response exchange.
//
// The application side pulls the request body with receive() and pushes the response with start() then send().
// Each operation is awaited: it completes immediately when possible, otherwise the application coroutine is parked
// on the cycle wake signal until the connection makes it ready (body bytes arrived, output drained, previous
// pipelined response fully written, client gone). Once the client is gone, every operation completes immediately
// with a disconnect result.
//
// Response bytes are only written to the connection while the cycle is head of line. A pipelined cycle behind it
// keeps its output aside, and hands it over when promoted, so that responses leave in request order.
class RequestResponseCycle {
 public:
  class ReceiveAwaiter {
   public:
    bool await_ready();
    bool await_suspend(std::coroutine_handle<> waiter);
    BodyEvent await_resume();

   private:
    friend class RequestResponseCycle;

    explicit ReceiveAwaiter(RequestResponseCycle& cycle) noexcept : _cycle(cycle) {}

    RequestResponseCycle& _cycle;
  };

  class SendAwaiter {
   public:
    [[nodiscard]] bool await_ready() const noexcept { return !_mustWait; }
    bool await_suspend(std::coroutine_handle<> waiter);
    SendStatus await_resume();

   private:
    friend class RequestResponseCycle;

    SendAwaiter(RequestResponseCycle& cycle, bool mustWait) noexcept : _cycle(cycle), _mustWait(mustWait) {}

    RequestResponseCycle& _cycle;
    bool _mustWait;
  };

  RequestResponseCycle(ConnectionHandler& handler, http::RequestHead request, uint32_t sequence,
                       std::unique_ptr<Signal> wakeSignal);

  RequestResponseCycle(const RequestResponseCycle&) = delete;
  RequestResponseCycle& operator=(const RequestResponseCycle&) = delete;

  ~RequestResponseCycle();

  [[nodiscard]] const http::RequestHead& request() const noexcept { return _request; }

  // Next piece of the request body: a Chunk with all the body bytes received since the previous call, End once after
  // the last chunk, then Disconnect once the response is complete or the client left.
  [[nodiscard]] ReceiveAwaiter receive() noexcept { return ReceiveAwaiter(*this); }

  // Records the response status and headers. They are written together with the first send().
  // Throws ResponseProtocolError if a response was already started or if the head is invalid.
  [[nodiscard]] SendAwaiter start(http::ResponseHead head);

  // Sends a piece of the response body. moreBody == false completes the response.
  // Throws ResponseProtocolError on contract violation, ClientDisconnected if a disconnect was already reported.
  [[nodiscard]] SendAwaiter send(std::string_view data, bool moreBody = false);

  [[nodiscard]] bool isDisconnected() const noexcept { return _disconnected; }

  [[nodiscard]] bool responseStarted() const noexcept { return _headStarted; }

  [[nodiscard]] bool responseComplete() const noexcept { return _responseComplete; }

 private:
  friend class ConnectionHandler;

  enum class AwaitReason : uint8_t { None, Body, Drain, Turn };

  enum class Framing : uint8_t { None, ContentLength, Chunked, CloseDelimited };

  // ---- connection facing ----

  void startTask(const Application& application);

  static void OnTaskFinished(void* cycle) noexcept;

  [[nodiscard]] bool taskStarted() const noexcept { return _taskStarted; }

  [[nodiscard]] bool taskDone() const noexcept { return _taskStarted && _task.done(); }

  [[nodiscard]] bool hasPendingWake() const noexcept { return _wakeSignal->isSet() && _wakeSignal->isAwaited(); }

  [[nodiscard]] bool readyToResume() const noexcept;

  // Resumes the parked coroutine.
  void resumeTask();

  // Parks the coroutine again after a wake-up that did not make its operation ready.
  void rearm();

  void deliverBody(std::string_view data);

  void completeBody();

  void disconnect();

  // Becomes head of line: flushes the output kept aside.
  void promote();

  // Computes the outcome once the task is done. May write a 500 response.
  void finalize();

  // Kills the exchange now, without running the application any further.
  void abandon() noexcept;

  [[nodiscard]] bool finalized() const noexcept { return _outcome != CycleOutcome::Pending; }

  [[nodiscard]] CycleOutcome outcome() const noexcept { return _outcome; }

  [[nodiscard]] uint32_t sequence() const noexcept { return _sequence; }

  [[nodiscard]] bool headWritten() const noexcept { return _headWritten; }

  [[nodiscard]] bool bodyComplete() const noexcept { return _bodyComplete; }

  [[nodiscard]] bool continueSent() const noexcept { return _continueSent; }

  [[nodiscard]] bool keepAliveAnnounced() const noexcept { return _keepAliveAnnounced; }

  [[nodiscard]] std::size_t bufferedBodyBytes() const noexcept { return _bodyQueue.size(); }

  [[nodiscard]] bool isHeadOfLine() const noexcept { return _headOfLine; }

  // ---- application facing helpers ----

  [[nodiscard]] bool receiveReady() const noexcept;

  void maybeSendContinue();

  void park(std::coroutine_handle<> waiter, AwaitReason reason);

  [[noreturn]] void violation(std::string_view message);

  [[nodiscard]] SendAwaiter disconnectedAwaiter();

  void writeHead(std::string& out, std::string_view firstData, bool moreBody);

  void emit(std::string_view bytes);

  void writeErrorResponse(http::StatusCode status);

  ConnectionHandler& _handler;
  http::RequestHead _request;
  http::ResponseHead _pendingHead;
  std::string _bodyQueue;
  std::string _held;  // response bytes produced while not head of line
  std::unique_ptr<Signal> _wakeSignal;
  std::exception_ptr _startException;
  std::size_t _expectedLength{};
  std::size_t _bodyBytesSent{};
  uint32_t _sequence;
  AwaitReason _awaitReason{AwaitReason::None};
  Framing _framing{Framing::None};
  CycleOutcome _outcome{CycleOutcome::Pending};
  bool _headOfLine{false};
  bool _taskStarted{false};
  bool _bodyComplete{false};
  bool _endDelivered{false};
  bool _disconnected{false};
  bool _disconnectReported{false};
  bool _headStarted{false};
  bool _headWritten{false};
  bool _responseComplete{false};
  bool _contractViolated{false};
  bool _continueSent{false};
  bool _keepAliveAnnounced{false};
  RequestTask _task;
};

}  // namespace keelson
