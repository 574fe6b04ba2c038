#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include "keelson/event-pool.hpp"
#include "keelson/flow-control.hpp"
#include "keelson/http-server-config.hpp"
#include "keelson/http-status-code.hpp"
#include "keelson/internal/protocol-state.hpp"
#include "keelson/request-parser.hpp"
#include "keelson/request-response-cycle.hpp"
#include "keelson/server-state.hpp"
#include "keelson/server-stats.hpp"
#include "keelson/timedef.hpp"
#include "keelson/transport.hpp"

namespace keelson {

// Owns the byte stream of one accepted connection and turns it into an ordered sequence of exchanges.
//
// At most two exchanges live at the same time: the head-of-line one, whose response is being produced or written,
// and one pipelined exchange whose request was already received. Parsing stops at the next message boundary until
// the head-of-line exchange finishes, which bounds the memory a pipelining client can make the server hold.
//
// The handler never touches the socket fd directly: it reads and writes through its transport and tells its owner
// what it needs through wantsWritable(), takeReadResumed() and isClosed(). Closing the fd is the owner's job.
class ConnectionHandler {
 public:
  using State = internal::ProtocolState;

  static constexpr std::size_t kMaxExchanges = 2;

  ConnectionHandler(uint64_t id, std::unique_ptr<ITransport> transport, const HttpServerConfig& config,
                    ServerState& serverState, EventPool& eventPool, ServerStats& stats,
                    const Application& application);

  ConnectionHandler(const ConnectionHandler&) = delete;
  ConnectionHandler& operator=(const ConnectionHandler&) = delete;

  ~ConnectionHandler();

  // Socket is readable: reads until the transport would block, reading is paused or the peer closed.
  void onReadable();

  void onBytesReceived(std::string_view data);

  // Socket is writable again: flushes pending output, which may resume paused exchanges.
  void onWritePossible();

  void onPeerClosed();

  // Catches up with exchanges resumed outside of socket events (tasks posted to the server).
  void refresh();

  // Graceful: the in-flight exchange completes, nothing new starts, then the connection closes.
  void shutdown();

  // Immediate: exchanges are told about the disconnect and destroyed.
  void forceClose();

  // Enforces keep-alive, head and body read timeouts, and the grace period of exchanges outliving their connection.
  void checkTimeouts(SteadyTimePoint now);

  [[nodiscard]] uint64_t id() const noexcept { return _id; }

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool isClosed() const noexcept { return _state == State::Closed; }

  // True once closed and no exchange is running any more.
  [[nodiscard]] bool isFinished() const noexcept { return isClosed() && _cycles.empty(); }

  [[nodiscard]] bool wantsWritable() const noexcept { return !isClosed() && !_outBuffer.empty(); }

  [[nodiscard]] bool isReadingPaused() const noexcept { return _flow.isReadingPaused(); }

  // True once after reading was resumed. With edge-triggered readiness the owner must then call onReadable() itself.
  [[nodiscard]] bool takeReadResumed() noexcept;

  [[nodiscard]] std::size_t nbExchanges() const noexcept { return _cycles.size(); }

  [[nodiscard]] uint32_t requestsServed() const noexcept { return _requestsServed; }

  [[nodiscard]] const FlowControlManager& flowControl() const noexcept { return _flow; }

 private:
  friend class RequestResponseCycle;

  enum class CloseMode : uint8_t { None, AfterFlush };

  void fire(internal::ConnectionEvent event);

  // Runs parsing, application resumption and pipeline advancement until nothing moves any more.
  void progress();

  void noteInput();

  void compactInput();

  bool parseBuffered();

  [[nodiscard]] bool canParse() const noexcept;

  void createExchange(http::RequestHead head);

  bool pump();

  bool advancePipeline();

  void onParseError(http::StatusCode status);

  void onClientTimeout(std::string_view reason);

  // Answers the request being received with an error status once earlier responses are out, then closes.
  void rejectRequest(http::StatusCode status);

  void emitPendingError();

  void removeExchange(const RequestResponseCycle& cycle);

  void closeAfterFlush();

  void closeTransport(internal::ConnectionEvent event = internal::ConnectionEvent::TransportClosed);

  void destroyExchanges();

  void updateReadPause();

  void flushOutput();

  // ---- used by exchanges ----

  // An application coroutine reached its end. Outside of pump(), it was resumed by something else than a cycle
  // operation, and the connection catches up right away.
  void onExchangeFinished() noexcept;

  // Write error: every exchange is told about the disconnect before its next operation.
  void onTransportFailure();

  void queueOutput(std::string_view bytes);

  void onResponseStarted(const RequestResponseCycle& cycle);

  [[nodiscard]] bool keepAliveCandidate(const RequestResponseCycle& cycle) const noexcept;

  [[nodiscard]] bool isInBody() const noexcept;

  uint64_t _id;
  std::unique_ptr<ITransport> _transport;
  const HttpServerConfig& _config;
  ServerState& _serverState;
  EventPool& _eventPool;
  ServerStats& _stats;
  const Application& _application;
  http::RequestParser _parser;
  FlowControlManager _flow;
  std::deque<std::unique_ptr<RequestResponseCycle>> _cycles;
  // Exchange whose request body is being parsed. Null when parsing a head, or when discarding the remaining body of an
  // exchange that already finished.
  RequestResponseCycle* _receiving{nullptr};
  std::string _inBuffer;
  std::size_t _inOffset{};
  std::string _outBuffer;
  SteadyTimePoint _lastActivity;
  SteadyTimePoint _lastRead;
  SteadyTimePoint _headStart;  // epoch when no partial head is buffered
  SteadyTimePoint _closedAt;
  uint32_t _exchangesCreated{};
  uint32_t _requestsServed{};
  http::StatusCode _pendingErrorStatus{};
  State _state{State::Idle};
  CloseMode _closeMode{CloseMode::None};
  bool _shuttingDown{false};
  bool _transportFailed{false};
  bool _readResumed{false};
  bool _inProgress{false};
  bool _inPump{false};
  bool _rerun{false};
};

}  // namespace keelson
