#include "keelson/request-response-cycle.hpp"

#include <fmt/format.h>

#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "keelson/connection-handler.hpp"
#include "keelson/http-constants.hpp"
#include "keelson/http-header.hpp"
#include "keelson/http-request-head.hpp"
#include "keelson/http-response-head.hpp"
#include "keelson/http-status-code.hpp"
#include "keelson/log.hpp"
#include "keelson/signal.hpp"
#include "keelson/simple-charconv.hpp"
#include "keelson/string-equal-ignore-case.hpp"

namespace keelson {

RequestResponseCycle::RequestResponseCycle(ConnectionHandler& handler, http::RequestHead request, uint32_t sequence,
                                           std::unique_ptr<Signal> wakeSignal)
    : _handler(handler), _request(std::move(request)), _wakeSignal(std::move(wakeSignal)), _sequence(sequence) {}

RequestResponseCycle::~RequestResponseCycle() {
  _task.reset();
  _handler._flow.removeWaiter(*_wakeSignal);
  _handler._eventPool.release(std::move(_wakeSignal));
}

bool RequestResponseCycle::ReceiveAwaiter::await_ready() {
  _cycle.maybeSendContinue();
  return _cycle.receiveReady();
}

bool RequestResponseCycle::ReceiveAwaiter::await_suspend(std::coroutine_handle<> waiter) {
  _cycle.park(waiter, AwaitReason::Body);
  return true;
}

BodyEvent RequestResponseCycle::ReceiveAwaiter::await_resume() {
  RequestResponseCycle& cycle = _cycle;
  cycle._awaitReason = AwaitReason::None;
  if (cycle._disconnected) {
    cycle._disconnectReported = true;
    return {BodyEvent::Type::Disconnect, {}};
  }
  if (cycle._responseComplete) {
    return {BodyEvent::Type::Disconnect, {}};
  }
  if (!cycle._bodyQueue.empty()) {
    BodyEvent event{BodyEvent::Type::Chunk, std::move(cycle._bodyQueue)};
    cycle._bodyQueue.clear();
    return event;
  }
  // receiveReady() guarantees that the end of body is pending here.
  cycle._endDelivered = true;
  return {BodyEvent::Type::End, {}};
}

bool RequestResponseCycle::SendAwaiter::await_suspend(std::coroutine_handle<> waiter) {
  _cycle.park(waiter, _cycle._headOfLine ? AwaitReason::Drain : AwaitReason::Turn);
  return true;
}

SendStatus RequestResponseCycle::SendAwaiter::await_resume() {
  _cycle._awaitReason = AwaitReason::None;
  if (_cycle._disconnected) {
    _cycle._disconnectReported = true;
    return SendStatus::Disconnected;
  }
  return SendStatus::Ok;
}

bool RequestResponseCycle::receiveReady() const noexcept {
  if (_disconnected || _responseComplete) {
    return true;
  }
  if (_handler._flow.isPaused()) {
    return false;
  }
  return !_bodyQueue.empty() || (_bodyComplete && !_endDelivered);
}

bool RequestResponseCycle::readyToResume() const noexcept {
  if (_disconnected) {
    return true;
  }
  switch (_awaitReason) {
    case AwaitReason::Body:
      return receiveReady();
    case AwaitReason::Drain:
      return !_handler._flow.isPaused();
    case AwaitReason::Turn:
      return _headOfLine;
    default:
      return true;
  }
}

void RequestResponseCycle::park(std::coroutine_handle<> waiter, AwaitReason reason) {
  // Readiness was checked just before suspending, an older set() is stale.
  _wakeSignal->reset();
  _wakeSignal->registerWaiter(waiter);
  _awaitReason = reason;
  if (reason == AwaitReason::Drain || (reason == AwaitReason::Body && _handler._flow.isPaused())) {
    _handler._flow.addWaiter(*_wakeSignal);
  }
}

void RequestResponseCycle::rearm() { park(_wakeSignal->takeWaiter(), _awaitReason); }

void RequestResponseCycle::startTask(const Application& application) {
  _taskStarted = true;
  try {
    _task = application(*this);
  } catch (...) {
    // Reported by finalize(), like exceptions thrown from the coroutine body.
    _startException = std::current_exception();
    return;
  }
  _task.setFinishCallback(&RequestResponseCycle::OnTaskFinished, this);
  _task.resume();
}

void RequestResponseCycle::OnTaskFinished(void* cycle) noexcept {
  static_cast<RequestResponseCycle*>(cycle)->_handler.onExchangeFinished();
}

void RequestResponseCycle::resumeTask() {
  std::coroutine_handle<> waiter = _wakeSignal->takeWaiter();
  _wakeSignal->reset();
  _handler._flow.removeWaiter(*_wakeSignal);
  if (waiter) {
    waiter.resume();
  }
}

void RequestResponseCycle::deliverBody(std::string_view data) {
  if (finalized() || taskDone()) {
    return;
  }
  _bodyQueue.append(data);
  if (_awaitReason == AwaitReason::Body) {
    _wakeSignal->set();
  }
}

void RequestResponseCycle::completeBody() {
  _bodyComplete = true;
  if (_awaitReason == AwaitReason::Body) {
    _wakeSignal->set();
  }
}

void RequestResponseCycle::disconnect() {
  if (_disconnected) {
    return;
  }
  _disconnected = true;
  _handler._flow.removeWaiter(*_wakeSignal);
  _wakeSignal->set();
}

void RequestResponseCycle::promote() {
  _headOfLine = true;
  if (!_held.empty()) {
    const std::string held = std::move(_held);
    _held.clear();
    _handler.queueOutput(held);
  }
  if (_headWritten) {
    _handler.onResponseStarted(*this);
  }
  if (_awaitReason == AwaitReason::Turn) {
    _wakeSignal->set();
  }
}

void RequestResponseCycle::maybeSendContinue() {
  if (_continueSent || _headStarted || _disconnected || _bodyComplete || !_bodyQueue.empty() ||
      !_request.expectsContinue()) {
    return;
  }
  _continueSent = true;
  // When not head of line, kept aside with the rest of the output until promotion.
  emit(http::Continue100Response);
}

void RequestResponseCycle::violation(std::string_view message) {
  _contractViolated = true;
  throw ResponseProtocolError(std::string(message));
}

RequestResponseCycle::SendAwaiter RequestResponseCycle::disconnectedAwaiter() {
  if (_disconnectReported) {
    throw ClientDisconnected(
        fmt::format("Client of {} {} already disconnected", _request.method(), _request.target()));
  }
  return {*this, false};
}

RequestResponseCycle::SendAwaiter RequestResponseCycle::start(http::ResponseHead head) {
  if (_disconnected) {
    return disconnectedAwaiter();
  }
  if (_headStarted) {
    violation("Response already started");
  }
  const http::StatusCode status = head.status();
  if (status < 200 || status > 999) {
    violation(fmt::format("Invalid response status code {}", status));
  }
  for (const http::Header& header : head.headers()) {
    if (!http::IsValidToken(header.name) || !http::IsValidHeaderValue(header.value)) {
      violation(fmt::format("Invalid response header '{}'", header.name));
    }
  }
  _pendingHead = std::move(head);
  _headStarted = true;
  return {*this, false};
}

RequestResponseCycle::SendAwaiter RequestResponseCycle::send(std::string_view data, bool moreBody) {
  if (_disconnected) {
    return disconnectedAwaiter();
  }
  if (!_headStarted) {
    violation("Response body sent before response start");
  }
  if (_responseComplete) {
    violation("Response already completed");
  }

  std::string out;
  if (!_headWritten) {
    writeHead(out, data, moreBody);
  }

  switch (_framing) {
    case Framing::ContentLength:
      if (_bodyBytesSent + data.size() > _expectedLength) {
        violation("Response content longer than Content-Length");
      }
      if (!moreBody && _bodyBytesSent + data.size() < _expectedLength) {
        violation("Response content shorter than Content-Length");
      }
      out.append(data);
      break;
    case Framing::Chunked:
      http::AppendChunk(out, data);
      if (!moreBody) {
        out.append(http::LastChunk);
      }
      break;
    case Framing::CloseDelimited:
      out.append(data);
      break;
    default:
      // HEAD request or status without body: body bytes are dropped.
      break;
  }

  _bodyBytesSent += data.size();
  _responseComplete = !moreBody;
  const bool firstWrite = !_headWritten;
  _headWritten = true;
  emit(out);
  if (firstWrite && _headOfLine) {
    _handler.onResponseStarted(*this);
  }

  if (_responseComplete) {
    // The connection flushes the rest on its own.
    return {*this, false};
  }
  if (!_headOfLine) {
    return {*this, _held.size() > _handler._flow.highWatermark()};
  }
  return {*this, _handler._flow.isPaused()};
}

void RequestResponseCycle::writeHead(std::string& out, std::string_view firstData, bool moreBody) {
  const http::StatusCode status = _pendingHead.status();
  const bool isHead = _request.isHead();
  const bool bodyAllowed = !isHead && !http::StatusForbidsBody(status);
  const auto appLength = _pendingHead.headerValue(http::ContentLength);
  const auto appEncoding = _pendingHead.headerValue(http::TransferEncoding);
  const auto appConnection = _pendingHead.headerValue(http::Connection);

  std::optional<std::size_t> declaredLength;
  if (appLength) {
    declaredLength = ParseUnsigned(TrimOws(*appLength));
    if (!declaredLength) {
      violation("Invalid Content-Length in response");
    }
  }
  if (appEncoding) {
    if (appLength) {
      violation("Response declares both Content-Length and Transfer-Encoding");
    }
    if (!CaseInsensitiveEqual(TrimOws(*appEncoding), http::Chunked)) {
      violation("Unsupported response Transfer-Encoding");
    }
    if (_request.version() < http::HTTP_1_1) {
      violation("Chunked response to an HTTP/1.0 request");
    }
  }

  std::optional<std::size_t> addedLength;
  bool addChunked = false;
  if (!bodyAllowed) {
    _framing = Framing::None;
    // A HEAD response announces the length the GET response would have.
    if (isHead && !appLength && !appEncoding && !moreBody && !http::StatusForbidsBody(status)) {
      addedLength = firstData.size();
    }
  } else if (declaredLength) {
    _framing = Framing::ContentLength;
    _expectedLength = *declaredLength;
  } else if (appEncoding) {
    _framing = Framing::Chunked;
  } else if (!moreBody) {
    _framing = Framing::ContentLength;
    _expectedLength = firstData.size();
    addedLength = firstData.size();
  } else if (_request.version() >= http::HTTP_1_1) {
    _framing = Framing::Chunked;
    addChunked = true;
  } else {
    _framing = Framing::CloseDelimited;
  }

  bool keepAlive = _framing != Framing::CloseDelimited && _handler.keepAliveCandidate(*this);
  if (appConnection && ContainsTokenIgnoreCase(*appConnection, http::ConnectionClose)) {
    keepAlive = false;
  }
  _keepAliveAnnounced = keepAlive;

  http::AppendStatusLine(out, status, _pendingHead.reason());
  ServerState& serverState = _handler._serverState;
  if (serverState.addDateHeader() && !_pendingHead.headerValue(http::Date)) {
    http::AppendHeader(out, http::Date, serverState.currentDateHeader());
  }
  for (const http::Header& header : serverState.defaultHeaders()) {
    if (!_pendingHead.headerValue(header.name)) {
      http::AppendHeader(out, header.name, header.value);
    }
  }
  for (const http::Header& header : _pendingHead.headers()) {
    // The server owns the Connection header, it reflects the final keep-alive decision.
    if (!CaseInsensitiveEqual(header.name, http::Connection)) {
      http::AppendHeader(out, header.name, header.value);
    }
  }
  if (addedLength) {
    const fmt::format_int length(*addedLength);
    http::AppendHeader(out, http::ContentLength, std::string_view(length.data(), length.size()));
  }
  if (addChunked) {
    http::AppendHeader(out, http::TransferEncoding, http::Chunked);
  }
  http::AppendHeader(out, http::Connection, keepAlive ? http::ConnectionKeepAlive : http::ConnectionClose);
  out.append(http::CRLF);
}

void RequestResponseCycle::emit(std::string_view bytes) {
  if (bytes.empty()) {
    return;
  }
  if (_headOfLine) {
    _handler.queueOutput(bytes);
  } else {
    _held.append(bytes);
  }
}

void RequestResponseCycle::writeErrorResponse(http::StatusCode status) {
  ServerState& serverState = _handler._serverState;
  const std::string_view date = serverState.addDateHeader() ? serverState.currentDateHeader() : std::string_view{};
  const std::string response = http::BuildSimpleResponse(status, serverState.defaultHeaders(), date);
  _headWritten = true;
  _responseComplete = true;
  _keepAliveAnnounced = false;
  emit(response);
  if (_headOfLine) {
    _handler.onResponseStarted(*this);
  }
}

void RequestResponseCycle::finalize() {
  CycleOutcome outcome = CycleOutcome::Pending;
  try {
    if (_startException) {
      std::rethrow_exception(_startException);
    }
    _task.rethrowIfFailed();
  } catch (const ResponseProtocolError& ex) {
    log::error("Response protocol violation for {} {}: {}", _request.method(), _request.target(), ex.what());
    outcome = CycleOutcome::AppError;
  } catch (const ClientDisconnected& ex) {
    log::debug("Application stopped: {}", ex.what());
    outcome = CycleOutcome::Disconnected;
  } catch (const std::exception& ex) {
    log::error("Exception in application for {} {}: {}", _request.method(), _request.target(), ex.what());
    outcome = CycleOutcome::AppError;
  } catch (...) {
    log::error("Unknown exception in application for {} {}", _request.method(), _request.target());
    outcome = CycleOutcome::AppError;
  }

  if (outcome == CycleOutcome::Pending) {
    if (_contractViolated) {
      outcome = CycleOutcome::AppError;
    } else if (_disconnected) {
      outcome = CycleOutcome::Disconnected;
    } else if (!_headWritten) {
      if (_headStarted) {
        log::error("Application returned without sending the response body for {} {}", _request.method(),
                   _request.target());
      } else {
        log::error("Application returned without starting a response for {} {}", _request.method(),
                   _request.target());
      }
      outcome = CycleOutcome::AppError;
    } else if (!_responseComplete) {
      log::error("Application returned before completing its response for {} {}", _request.method(),
                 _request.target());
      outcome = CycleOutcome::AppError;
    } else {
      outcome = CycleOutcome::Completed;
    }
  }

  if (outcome == CycleOutcome::AppError && !_disconnected) {
    if (!_headWritten) {
      writeErrorResponse(http::StatusCodeInternalServerError);
    } else if (!_responseComplete) {
      // Incomplete framing: the connection is cut, bytes still kept aside never leave.
      _held.clear();
    }
  }

  switch (outcome) {
    case CycleOutcome::AppError:
      ++_handler._stats.applicationErrors;
      break;
    case CycleOutcome::Disconnected:
      ++_handler._stats.clientDisconnects;
      break;
    default:
      break;
  }

  _outcome = outcome;
  _awaitReason = AwaitReason::None;
  _task.reset();
}

void RequestResponseCycle::abandon() noexcept {
  _task.reset();
  _disconnected = true;
  _held.clear();
  _outcome = CycleOutcome::Disconnected;
}

}  // namespace keelson
