#include "keelson/connection-handler.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "keelson/event-pool.hpp"
#include "keelson/http-request-head.hpp"
#include "keelson/http-response-head.hpp"
#include "keelson/http-server-config.hpp"
#include "keelson/http-status-code.hpp"
#include "keelson/internal/protocol-state.hpp"
#include "keelson/log.hpp"
#include "keelson/request-parser.hpp"
#include "keelson/request-response-cycle.hpp"
#include "keelson/server-state.hpp"
#include "keelson/server-stats.hpp"
#include "keelson/timedef.hpp"
#include "keelson/transport.hpp"

namespace keelson {

using internal::ConnectionEvent;

namespace {

constexpr SteadyTimePoint kNoTime{};

}  // namespace

ConnectionHandler::ConnectionHandler(uint64_t id, std::unique_ptr<ITransport> transport,
                                     const HttpServerConfig& config, ServerState& serverState, EventPool& eventPool,
                                     ServerStats& stats, const Application& application)
    : _id(id),
      _transport(std::move(transport)),
      _config(config),
      _serverState(serverState),
      _eventPool(eventPool),
      _stats(stats),
      _application(application),
      _parser(http::RequestParser::Limits{config.maxHeaderBytes, config.maxBodyBytes}),
      _flow(config.flowControlLowWatermark, config.flowControlHighWatermark),
      _lastActivity(SteadyClock::now()),
      _lastRead(_lastActivity) {
  _serverState.onConnectionOpened();
  log::debug("Connection #{} opened", _id);
}

ConnectionHandler::~ConnectionHandler() {
  destroyExchanges();
  _serverState.onConnectionClosed();
  log::debug("Connection #{} released after {} request(s)", _id, _requestsServed);
}

void ConnectionHandler::fire(ConnectionEvent event) {
  const internal::Transition transition = internal::NextProtocolState(_state, event);
  switch (transition.kind) {
    case internal::Transition::Kind::Move:
      log::trace("Connection #{} {} -> {} ({})", _id, internal::ProtocolStateName(_state),
                 internal::ProtocolStateName(transition.target), internal::ConnectionEventName(event));
      _state = transition.target;
      break;
    case internal::Transition::Kind::Invalid:
      log::warn("Connection #{} ignoring event {} in state {}", _id, internal::ConnectionEventName(event),
                internal::ProtocolStateName(_state));
      break;
    default:
      break;
  }
}

bool ConnectionHandler::takeReadResumed() noexcept { return std::exchange(_readResumed, false); }

void ConnectionHandler::onReadable() {
  while (!isClosed() && _state != State::Closing && !_flow.isReadingPaused()) {
    compactInput();
    const std::size_t oldSize = _inBuffer.size();
    _inBuffer.resize(oldSize + _config.readChunkSize);
    const auto [nbRead, want] = _transport->read(_inBuffer.data() + oldSize, _config.readChunkSize);
    _inBuffer.resize(oldSize + nbRead);
    if (nbRead != 0) {
      noteInput();
      progress();
      continue;
    }
    if (want != TransportHint::ReadReady) {
      // Orderly shutdown (0 bytes) or reset.
      onPeerClosed();
    }
    break;
  }
}

void ConnectionHandler::onBytesReceived(std::string_view data) {
  if (isClosed() || _state == State::Closing || data.empty()) {
    return;
  }
  compactInput();
  _inBuffer.append(data);
  noteInput();
  progress();
}

void ConnectionHandler::noteInput() {
  _lastRead = SteadyClock::now();
  _lastActivity = _lastRead;
  if (_state == State::Idle) {
    fire(ConnectionEvent::RequestBytes);
  }
}

void ConnectionHandler::compactInput() {
  if (_inOffset != 0) {
    _inBuffer.erase(0, _inOffset);
    _inOffset = 0;
  }
}

void ConnectionHandler::onWritePossible() {
  if (isClosed()) {
    return;
  }
  flushOutput();
  progress();
}

void ConnectionHandler::refresh() {
  if (!isClosed()) {
    progress();
    return;
  }
  // Lingering exchanges: the finished ones are reaped without waiting for the grace period.
  pump();
  std::erase_if(_cycles, [](const auto& cycle) { return cycle->finalized(); });
}

void ConnectionHandler::onPeerClosed() {
  if (isClosed()) {
    return;
  }
  log::debug("Connection #{} closed by peer with {} exchange(s) in flight", _id, _cycles.size());
  closeTransport(ConnectionEvent::PeerClosed);
}

void ConnectionHandler::shutdown() {
  if (isClosed() || _state == State::Closing) {
    return;
  }
  _shuttingDown = true;
  fire(ConnectionEvent::Shutdown);
  if (_cycles.empty()) {
    closeAfterFlush();
    return;
  }
  // Pipelined requests behind the head of line are never answered.
  while (_cycles.size() > 1) {
    if (_receiving == _cycles.back().get()) {
      _receiving = nullptr;
    }
    _cycles.back()->abandon();
    _cycles.pop_back();
  }
  log::debug("Connection #{} finishing its in-flight exchange before shutdown", _id);
  progress();
}

void ConnectionHandler::forceClose() {
  if (!isClosed()) {
    log::debug("Connection #{} force closed", _id);
    closeTransport();
  }
  destroyExchanges();
}

void ConnectionHandler::checkTimeouts(SteadyTimePoint now) {
  if (isClosed()) {
    if (!_cycles.empty() && now - _closedAt >= _config.cycleGracePeriod) {
      log::warn("Connection #{} destroying {} exchange(s) still running after disconnect", _id, _cycles.size());
      destroyExchanges();
    }
    return;
  }
  if (_transportFailed) {
    closeTransport(ConnectionEvent::PeerClosed);
    return;
  }
  if (_state == State::Closing) {
    return;
  }
  const bool idle = _cycles.empty() && !isInBody() && _headStart == kNoTime && _inOffset == _inBuffer.size();
  if (idle) {
    if (_config.keepAliveTimeout.count() > 0 && _outBuffer.empty() &&
        now - _lastActivity >= _config.keepAliveTimeout) {
      log::debug("Connection #{} idle for more than {} ms, closing", _id, _config.keepAliveTimeout.count());
      closeTransport();
    }
    return;
  }
  if (_headStart != kNoTime && _cycles.empty()) {
    // Without a head timeout, a partial head is held no longer than an idle connection.
    const auto limit = _config.headerReadTimeout.count() > 0 ? _config.headerReadTimeout : _config.keepAliveTimeout;
    if (limit.count() > 0 && now - _headStart >= limit) {
      onClientTimeout("request head not received in time");
    }
    return;
  }
  if (_config.bodyReadTimeout.count() > 0 && isInBody() && !_flow.isReadingPaused() &&
      now - _lastRead >= _config.bodyReadTimeout) {
    if (_receiving == nullptr && _cycles.empty()) {
      // Discarding the body of an answered request: nobody is waiting for an error response.
      ++_stats.timeouts;
      log::debug("Connection #{} stalled while sending an unread request body, closing", _id);
      closeTransport();
      return;
    }
    onClientTimeout("request body stalled");
  }
}

void ConnectionHandler::progress() {
  if (_inProgress) {
    return;
  }
  _inProgress = true;
  bool again = true;
  while (again && !isClosed()) {
    again = parseBuffered();
    again = pump() || again;
    again = std::exchange(_rerun, false) || again;
    if (_transportFailed) {
      closeTransport(ConnectionEvent::PeerClosed);
      break;
    }
    again = advancePipeline() || again;
  }
  if (_closeMode == CloseMode::AfterFlush && _outBuffer.empty()) {
    closeTransport();
  }
  updateReadPause();
  _inProgress = false;
}

bool ConnectionHandler::isInBody() const noexcept {
  switch (_parser.state()) {
    case http::RequestParser::State::FixedBody:
    case http::RequestParser::State::ChunkSize:
    case http::RequestParser::State::ChunkData:
    case http::RequestParser::State::ChunkDataEnd:
    case http::RequestParser::State::Trailers:
      return true;
    default:
      return false;
  }
}

bool ConnectionHandler::canParse() const noexcept {
  if (_state == State::Closing || _state == State::Closed || _closeMode != CloseMode::None ||
      _pendingErrorStatus != 0 || _parser.hasError()) {
    return false;
  }
  if (!_parser.atMessageBoundary()) {
    return true;
  }
  if (!_cycles.empty() && (!_config.enableKeepAlive || _cycles.back()->request().clientRequestsClose())) {
    // The connection ends with that exchange: whatever follows is never parsed, nor run.
    return false;
  }
  return _cycles.size() < kMaxExchanges && !_shuttingDown && _exchangesCreated < _config.maxRequestsPerConnection;
}

bool ConnectionHandler::parseBuffered() {
  bool progressed = false;
  while (canParse() &&
         (_inOffset < _inBuffer.size() || _parser.state() == http::RequestParser::State::Done)) {
    std::size_t consumed = 0;
    const auto result = _parser.parse(std::string_view(_inBuffer).substr(_inOffset), consumed);
    progressed = progressed || consumed != 0;
    if (result.event == http::RequestParser::Event::BodyData && _receiving != nullptr) {
      // Points into _inBuffer: deliver before moving the offset.
      _receiving->deliverBody(result.data);
    }
    _inOffset += consumed;
    if (result.event == http::RequestParser::Event::NeedMore) {
      break;
    }
    switch (result.event) {
      case http::RequestParser::Event::HeadComplete:
        createExchange(_parser.takeHead());
        progressed = true;
        break;
      case http::RequestParser::Event::MessageComplete:
        if (_receiving != nullptr) {
          _receiving->completeBody();
          _receiving = nullptr;
        }
        progressed = true;
        break;
      case http::RequestParser::Event::Error:
        onParseError(result.errorStatus);
        return true;
      default:
        break;
    }
  }

  const bool partialHead = canParse() && (_parser.state() == http::RequestParser::State::Headers ||
                                          (_parser.atMessageBoundary() && _inOffset < _inBuffer.size()));
  if (!partialHead) {
    _headStart = kNoTime;
  } else if (_headStart == kNoTime) {
    _headStart = SteadyClock::now();
  }
  return progressed;
}

void ConnectionHandler::createExchange(http::RequestHead head) {
  ++_exchangesCreated;
  log::debug("Connection #{} request #{}: {} {}", _id, _exchangesCreated, head.method(), head.target());
  auto cycle = std::make_unique<RequestResponseCycle>(*this, std::move(head), _exchangesCreated, _eventPool.acquire());
  cycle->_headOfLine = _cycles.empty();
  _receiving = cycle.get();
  _cycles.push_back(std::move(cycle));
  fire(ConnectionEvent::HeadComplete);
}

bool ConnectionHandler::pump() {
  if (_inPump) {
    return false;
  }
  _inPump = true;
  bool progressed = false;
  for (bool again = true; again;) {
    again = false;
    // Exchanges are neither added nor removed while their coroutines run.
    for (std::size_t pos = 0; pos < _cycles.size(); ++pos) {
      RequestResponseCycle& cycle = *_cycles[pos];
      if (cycle.finalized()) {
        continue;
      }
      if (!cycle.taskStarted()) {
        cycle.startTask(_application);
        again = true;
      } else if (cycle.hasPendingWake()) {
        if (cycle.readyToResume()) {
          cycle.resumeTask();
          again = true;
        } else {
          cycle.rearm();
        }
      }
      if (cycle.taskDone()) {
        cycle.finalize();
        again = true;
      }
    }
    progressed = progressed || again;
  }
  _inPump = false;
  return progressed;
}

bool ConnectionHandler::advancePipeline() {
  bool progressed = false;
  while (!_cycles.empty() && _cycles.front()->finalized() && !isClosed()) {
    std::unique_ptr<RequestResponseCycle> cycle = std::move(_cycles.front());
    _cycles.pop_front();
    progressed = true;
    if (_receiving == cycle.get()) {
      // The rest of its body, if any, is parsed and dropped.
      _receiving = nullptr;
    }

    const CycleOutcome outcome = cycle->outcome();
    bool keepAlive = false;
    if (outcome == CycleOutcome::Completed) {
      ++_requestsServed;
      ++_stats.totalRequestsServed;
      _serverState.onRequestServed();
      keepAlive = cycle->keepAliveAnnounced() && !_shuttingDown && _pendingErrorStatus == 0;
    } else if (outcome == CycleOutcome::Disconnected ||
               (outcome == CycleOutcome::AppError && !cycle->responseComplete())) {
      cycle.reset();
      closeTransport();
      return true;
    }
    const bool pendingError = outcome == CycleOutcome::Completed && _pendingErrorStatus != 0;
    cycle.reset();

    if (keepAlive) {
      if (_cycles.empty()) {
        fire(ConnectionEvent::ExchangeDone);
        _lastActivity = SteadyClock::now();
      } else {
        fire(ConnectionEvent::NextExchange);
        _cycles.front()->promote();
      }
      continue;
    }

    destroyExchanges();
    if (pendingError) {
      emitPendingError();
    } else {
      fire(ConnectionEvent::CloseAfterResponse);
      closeAfterFlush();
    }
    return true;
  }
  return progressed;
}

void ConnectionHandler::onParseError(http::StatusCode status) {
  ++_stats.parseErrors;
  log::debug("Connection #{} received an invalid request, answering {}", _id, status);
  rejectRequest(status);
}

void ConnectionHandler::onClientTimeout(std::string_view reason) {
  ++_stats.timeouts;
  log::warn("Connection #{} timed out: {}", _id, reason);
  rejectRequest(http::StatusCodeRequestTimeout);
}

void ConnectionHandler::rejectRequest(http::StatusCode status) {
  RequestResponseCycle* target = _receiving;
  _receiving = nullptr;
  _inBuffer.clear();
  _inOffset = 0;
  _headStart = kNoTime;
  if (target != nullptr) {
    if (target->isHeadOfLine() && target->headWritten()) {
      // Too late for an error response.
      fire(ConnectionEvent::ProtocolError);
      if (target->responseComplete()) {
        closeAfterFlush();
      } else {
        closeTransport();
      }
      return;
    }
    target->abandon();
    removeExchange(*target);
  }
  _pendingErrorStatus = status;
  if (_cycles.empty()) {
    emitPendingError();
  }
}

void ConnectionHandler::emitPendingError() {
  fire(ConnectionEvent::ProtocolError);
  const std::string_view date =
      _serverState.addDateHeader() ? _serverState.currentDateHeader() : std::string_view{};
  queueOutput(http::BuildSimpleResponse(_pendingErrorStatus, _serverState.defaultHeaders(), date));
  closeAfterFlush();
}

void ConnectionHandler::removeExchange(const RequestResponseCycle& cycle) {
  const auto it = std::ranges::find_if(_cycles, [&cycle](const auto& ptr) { return ptr.get() == &cycle; });
  if (it != _cycles.end()) {
    _cycles.erase(it);
  }
}

void ConnectionHandler::closeAfterFlush() {
  if (isClosed()) {
    return;
  }
  if (_outBuffer.empty() || _transportFailed) {
    closeTransport();
  } else {
    _closeMode = CloseMode::AfterFlush;
  }
}

void ConnectionHandler::closeTransport(ConnectionEvent event) {
  if (isClosed()) {
    return;
  }
  fire(event);
  _closedAt = SteadyClock::now();
  _closeMode = CloseMode::None;
  _receiving = nullptr;
  _inBuffer.clear();
  _inOffset = 0;
  _flow.onBytesDrained(_outBuffer.size());
  _outBuffer.clear();
  for (auto& cycle : _cycles) {
    cycle->disconnect();
  }
  // Exchanges observe the disconnect now. Those still running afterwards get the grace period.
  pump();
  std::erase_if(_cycles, [](const auto& cycle) { return cycle->finalized(); });
}

void ConnectionHandler::destroyExchanges() {
  _receiving = nullptr;
  _cycles.clear();
}

void ConnectionHandler::updateReadPause() {
  if (isClosed()) {
    return;
  }
  const bool mustPause = _state == State::Closing || _closeMode != CloseMode::None || _pendingErrorStatus != 0 ||
                         (_parser.atMessageBoundary() && !canParse()) ||
                         (_receiving != nullptr && _receiving->bufferedBodyBytes() > _config.maxBufferedBodyBytes);
  if (mustPause && !_flow.isReadingPaused()) {
    log::trace("Connection #{} pauses reading", _id);
    _flow.pauseReading();
  } else if (!mustPause && _flow.isReadingPaused()) {
    log::trace("Connection #{} resumes reading", _id);
    _flow.resumeReading();
    _readResumed = true;
    _lastRead = SteadyClock::now();
  }
}

void ConnectionHandler::flushOutput() {
  while (!_outBuffer.empty()) {
    const auto [nbWritten, want] = _transport->write(_outBuffer);
    if (nbWritten != 0) {
      _outBuffer.erase(0, nbWritten);
      _stats.totalBytesWrittenFlush += nbWritten;
      _flow.onBytesDrained(nbWritten);
    }
    if (want == TransportHint::Error) {
      onTransportFailure();
      break;
    }
    if (want == TransportHint::WriteReady) {
      break;
    }
  }
}

void ConnectionHandler::onExchangeFinished() noexcept {
  if (_inPump || _inProgress) {
    _rerun = true;
    return;
  }
  try {
    refresh();
  } catch (const std::exception& ex) {
    log::critical("Connection #{} failed to complete an exchange: {}", _id, ex.what());
    forceClose();
  }
}

void ConnectionHandler::onTransportFailure() {
  if (_transportFailed) {
    return;
  }
  _transportFailed = true;
  log::debug("Connection #{} transport failure while writing", _id);
  _flow.onBytesDrained(_outBuffer.size());
  _outBuffer.clear();
  for (auto& cycle : _cycles) {
    cycle->disconnect();
  }
}

void ConnectionHandler::queueOutput(std::string_view bytes) {
  if (isClosed() || _transportFailed || bytes.empty()) {
    return;
  }
  _stats.totalBytesQueued += bytes.size();
  if (_outBuffer.empty()) {
    const auto [nbWritten, want] = _transport->write(bytes);
    _stats.totalBytesWrittenImmediate += nbWritten;
    if (want == TransportHint::Error) {
      onTransportFailure();
      return;
    }
    bytes.remove_prefix(nbWritten);
    if (bytes.empty()) {
      return;
    }
    ++_stats.deferredWriteEvents;
  }
  _outBuffer.append(bytes);
  const bool wasPaused = _flow.isPaused();
  _flow.onBytesQueued(bytes.size());
  if (!wasPaused && _flow.isPaused()) {
    ++_stats.flowControlPauses;
  }
}

void ConnectionHandler::onResponseStarted(const RequestResponseCycle& cycle) {
  if (!_cycles.empty() && _cycles.front().get() == &cycle) {
    fire(ConnectionEvent::ResponseStarted);
  }
}

bool ConnectionHandler::keepAliveCandidate(const RequestResponseCycle& cycle) const noexcept {
  return _config.enableKeepAlive && !cycle.request().clientRequestsClose() &&
         cycle.sequence() < _config.maxRequestsPerConnection && !_shuttingDown && _pendingErrorStatus == 0 &&
         // the client may still be waiting for a 100 Continue before sending its body
         (cycle.bodyComplete() || cycle.continueSent() || !cycle.request().expectsContinue());
}

}  // namespace keelson
