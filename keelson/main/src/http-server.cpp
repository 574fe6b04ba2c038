#include "keelson/http-server.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include "keelson/connection-handler.hpp"
#include "keelson/connection.hpp"
#include "keelson/event-loop.hpp"
#include "keelson/event.hpp"
#include "keelson/http-server-config.hpp"
#include "keelson/lifecycle-controller.hpp"
#include "keelson/log.hpp"
#include "keelson/request-response-cycle.hpp"
#include "keelson/server-stats.hpp"
#include "keelson/signal-handler.hpp"
#include "keelson/socket.hpp"
#include "keelson/timedef.hpp"
#include "keelson/transport.hpp"

namespace keelson {

namespace {

constexpr EventBmp kClientEvents = EventIn | EventRdHup | EventEt;

}  // namespace

HttpServer::AsyncHandle::AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error)
    : _thread(std::move(thread)), _error(std::move(error)) {}

HttpServer::AsyncHandle::~AsyncHandle() { stop(); }

void HttpServer::AsyncHandle::stop() noexcept {
  if (_thread.joinable()) {
    _thread.request_stop();
    _thread.join();
  }
}

void HttpServer::AsyncHandle::rethrowIfError() {
  if (_error && *_error) {
    std::rethrow_exception(*_error);
  }
}

HttpServer::HttpServer(HttpServerConfig config, Application application)
    : _config(std::move(config)),
      _application(std::move(application)),
      _serverState(_config.globalHeaders, _config.addDateHeader),
      _eventPool(_config.eventPoolCapacity),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(_config.pollInterval) {
  initListener();
}

HttpServer::~HttpServer() {
  // Exchanges still alive are destroyed with their handlers, their coroutines never resume.
  _lingering.clear();
  _connections.clear();
}

void HttpServer::initListener() {
  _config.validate();
  if (!_application) {
    throw std::invalid_argument("HttpServer requires an application");
  }

  _listenSocket.bindAndListen(_config.reusePort, _config.port);

  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_lifecycle.wakeupFd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_lifecycle.completionFd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_postedFd.fd(), EventIn});

  _maintenanceTimer.every(_config.pollInterval);
  _eventLoop.addOrThrow(EventLoop::EventFd{_maintenanceTimer.fd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_shutdownDeadlineTimer.fd(), EventIn});
  _eventLoop.addOrThrow(EventLoop::EventFd{_notifyTimer.fd(), EventIn});
}

void HttpServer::prepareRun() {
  if (_lifecycle.state() != LifecycleController::State::NotStarted) {
    throw std::logic_error("Server already running or stopped");
  }
  try {
    _lifecycle.startup();
  } catch (const std::exception&) {
    _eventLoop.del(_listenSocket.fd());
    _listenSocket.close();
    throw;
  }
  if (_notifyCallback) {
    _notifyTimer.every(_config.notifyInterval);
  }
  log::info("Server running on port :{}", port());
}

void HttpServer::run() { runUntil({}); }

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  prepareRun();
  while (!_finished) {
    if (predicate && !_lifecycle.isShutdownRequested() && predicate()) {
      stop();
    }
    eventLoop();
  }
  log::info("Finished server process");
}

HttpServer::AsyncHandle HttpServer::start() {
  auto errorPtr = std::make_shared<std::exception_ptr>();

  return {std::jthread([this, errorPtr](const std::stop_token& st) {
            // Wakes the loop as soon as the handle asks for the stop instead of waiting for the next poll.
            std::stop_callback onStop(st, [this]() { stop(); });
            try {
              runUntil([&st]() { return st.stop_requested(); });
            } catch (...) {
              *errorPtr = std::current_exception();
            }
          }),
          std::move(errorPtr)};
}

void HttpServer::stop() noexcept { beginShutdown(_config.gracefulShutdownTimeout); }

void HttpServer::forceStop() noexcept {
  if (_lifecycle.state() != LifecycleController::State::NotStarted) {
    _lifecycle.requestShutdown(std::chrono::milliseconds{0}, true);
  }
}

void HttpServer::beginShutdown(std::chrono::milliseconds maxWait) noexcept {
  if (_lifecycle.state() == LifecycleController::State::NotStarted) {
    log::debug("Shutdown requested on a server that is not running");
    return;
  }
  _lifecycle.requestShutdown(maxWait);
}

void HttpServer::setNotifyCallback(NotifyCallback callback) { _notifyCallback = std::move(callback); }

void HttpServer::post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(_postedMutex);
    _posted.push_back(std::move(task));
  }
  _postedFd.notify();
}

ServerStats HttpServer::stats() const {
  ServerStats stats = _stats;
  stats.activeConnections = _serverState.activeConnections();
  const EventPool::Stats poolStats = _eventPool.stats();
  stats.eventPoolHits = poolStats.hits;
  stats.eventPoolMisses = poolStats.misses;
  stats.eventPoolDiscards = poolStats.discards;
  return stats;
}

void HttpServer::eventLoop() {
  bool completion = false;
  for (const auto& [eventBmp, fd] : _eventLoop.poll()) {
    if (fd == _listenSocket.fd()) {
      acceptNewConnections();
    } else if (fd == _lifecycle.wakeupFd()) {
      _lifecycle.consumeWakeup();
    } else if (fd == _lifecycle.completionFd()) {
      completion = true;
    } else if (fd == _postedFd.fd()) {
      runPostedTasks();
    } else if (fd == _maintenanceTimer.fd()) {
      _maintenanceTimer.drain();
      sweepConnections();
      checkProcessSignals();
    } else if (fd == _shutdownDeadlineTimer.fd()) {
      _shutdownDeadlineTimer.drain();
      if (_shutdownStarted && nbOpenConnections() != 0) {
        log::warn("Cancel {} running connection(s), graceful shutdown timeout exceeded", nbOpenConnections());
        cancelConnections();
      }
    } else if (fd == _notifyTimer.fd()) {
      _notifyTimer.drain();
      if (_notifyCallback && !_shutdownStarted) {
        _notifyCallback(stats());
      }
    } else {
      serviceConnection(fd, eventBmp);
    }
  }

  checkRequestLimit();
  if (_lifecycle.isShutdownRequested()) {
    onShutdownRequested();
  }
  if (completion && _shutdownStarted && nbOpenConnections() == 0) {
    finishShutdown();
  }
}

void HttpServer::acceptNewConnections() {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int cnxFd = cnx.fd();
    if (_shutdownStarted) {
      log::debug("Refusing connection fd # {} during shutdown", cnxFd);
      continue;
    }
    if (_config.maxConnections != 0 && _connections.size() >= _config.maxConnections) {
      ++_stats.connectionsRefused;
      log::warn("Maximum number of connections ({}) reached, closing connection fd # {}", _config.maxConnections,
                cnxFd);
      continue;
    }
    if (_config.tcpNoDelay) {
      cnx.setTcpNoDelay();
    }
    if (!_eventLoop.add(EventLoop::EventFd{cnxFd, kClientEvents})) {
      continue;
    }
    ++_stats.connectionsAccepted;

    auto handler = std::make_unique<ConnectionHandler>(++_nextConnectionId, std::make_unique<PlainTransport>(cnxFd),
                                                       _config, _serverState, _eventPool, _stats, _application);
    auto [cnxIt, inserted] = _connections.emplace(cnxFd, ConnectionEntry{std::move(cnx), std::move(handler)});
    if (!inserted) {
      // The kernel reuses an fd only after it was closed, which removes its entry first.
      log::error("Internal error: accepted connection fd # {} already present in connection map", cnxFd);
      _eventLoop.del(cnxFd);
      continue;
    }
    // Data may already be there, and edge-triggered readiness would not report it again.
    cnxIt->second.handler->onReadable();
    refreshConnection(cnxIt);
  }
}

void HttpServer::runPostedTasks() {
  _postedFd.drain();
  std::vector<std::function<void()>> tasks;
  {
    std::lock_guard<std::mutex> lock(_postedMutex);
    tasks.swap(_posted);
  }
  for (auto& task : tasks) {
    try {
      task();
    } catch (const std::exception& ex) {
      log::error("Posted task failed: {}", ex.what());
    }
  }
  log::trace("{} posted task(s) run", tasks.size());

  // Resumed exchanges may have written, finished, or been the last ones of a closed connection.
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt->second.handler->refresh();
    cnxIt = refreshConnection(cnxIt);
  }
  const auto nbErased = std::erase_if(_lingering, [](const auto& handler) {
    handler->refresh();
    return handler->isFinished();
  });
  if (nbErased != 0) {
    reportRemainingConnections();
  }
}

void HttpServer::serviceConnection(int fd, EventBmp eventBmp) {
  auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    log::trace("Event for unknown fd # {}", fd);
    return;
  }
  ConnectionHandler& handler = *cnxIt->second.handler;
  if ((eventBmp & EventOut) != 0) {
    handler.onWritePossible();
  }
  if ((eventBmp & (EventIn | EventRdHup)) != 0) {
    // With reading paused, a pending EOF is seen when reading resumes.
    handler.onReadable();
  }
  if ((eventBmp & (EventHup | EventErr)) != 0) {
    handler.onPeerClosed();
  }
  refreshConnection(cnxIt);
}

HttpServer::ConnectionMap::iterator HttpServer::refreshConnection(ConnectionMap::iterator cnxIt) {
  ConnectionEntry& entry = cnxIt->second;
  ConnectionHandler& handler = *entry.handler;
  while (!handler.isClosed() && handler.takeReadResumed()) {
    handler.onReadable();
  }
  if (handler.isClosed()) {
    return closeConnection(cnxIt);
  }
  const bool wantsWritable = handler.wantsWritable();
  if (wantsWritable != entry.waitingWritable) {
    const EventBmp events = wantsWritable ? (kClientEvents | EventOut) : kClientEvents;
    if (_eventLoop.mod(EventLoop::EventFd{cnxIt->first, events})) {
      entry.waitingWritable = wantsWritable;
    } else {
      handler.forceClose();
      return closeConnection(cnxIt);
    }
  }
  return std::next(cnxIt);
}

HttpServer::ConnectionMap::iterator HttpServer::closeConnection(ConnectionMap::iterator cnxIt) {
  const int cfd = cnxIt->first;
  _eventLoop.del(cfd);

  std::unique_ptr<ConnectionHandler> handler = std::move(cnxIt->second.handler);
  if (!handler->isClosed()) {
    handler->forceClose();
  }
  if (!handler->isFinished()) {
    log::debug("Connection #{} closed with {} exchange(s) still running", handler->id(), handler->nbExchanges());
    _lingering.push_back(std::move(handler));
  }
  auto nextIt = _connections.erase(cnxIt);
  reportRemainingConnections();
  return nextIt;
}

void HttpServer::sweepConnections() {
  const auto now = SteadyClock::now();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt->second.handler->checkTimeouts(now);
    cnxIt = refreshConnection(cnxIt);
  }
  const auto nbErased = std::erase_if(_lingering, [now](const auto& handler) {
    handler->checkTimeouts(now);
    return handler->isFinished();
  });
  if (nbErased != 0) {
    reportRemainingConnections();
  }
}

void HttpServer::checkProcessSignals() {
  if (SignalHandler::IsForceExitRequested()) {
    if (!_lifecycle.isForceRequested()) {
      log::warn("Second interrupt received, forcing exit");
      forceStop();
    }
  } else if (SignalHandler::IsStopRequested() && !_lifecycle.isShutdownRequested()) {
    log::info("Stop signal received");
    beginShutdown(SignalHandler::GetGracePeriod());
  }
}

void HttpServer::checkRequestLimit() {
  if (_config.limitMaxRequests != 0 && !_lifecycle.isShutdownRequested() &&
      _serverState.totalRequests() >= _config.limitMaxRequests) {
    log::warn("Maximum request limit of {} exceeded. Terminating process.", _config.limitMaxRequests);
    stop();
  }
}

void HttpServer::onShutdownRequested() {
  if (_finished) {
    return;
  }
  if (!_shutdownStarted) {
    _shutdownStarted = true;
    log::info("Shutting down");
    _eventLoop.del(_listenSocket.fd());
    _listenSocket.close();
    _notifyTimer.stop();

    for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
      cnxIt->second.handler->shutdown();
      cnxIt = refreshConnection(cnxIt);
    }
    if (nbOpenConnections() != 0) {
      log::info("Waiting for {} connection(s) to close", nbOpenConnections());
    }
  }

  const std::chrono::milliseconds gracePeriod = _lifecycle.gracePeriod();
  if (gracePeriod.count() > 0) {
    const auto deadline = SteadyClock::now() + gracePeriod;
    if (_shutdownDeadline == SteadyTimePoint{} || deadline < _shutdownDeadline) {
      _shutdownDeadline = deadline;
      _shutdownDeadlineTimer.schedule(gracePeriod);
    }
  }

  if (_lifecycle.isForceRequested() && nbOpenConnections() != 0) {
    log::warn("Cancel {} running connection(s), forced shutdown", nbOpenConnections());
    cancelConnections();
  }
  _lifecycle.onConnectionClosed(nbOpenConnections());
}

void HttpServer::cancelConnections() {
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt->second.handler->forceClose();
    cnxIt = closeConnection(cnxIt);
  }
  _lingering.clear();
  reportRemainingConnections();
}

void HttpServer::reportRemainingConnections() {
  if (_shutdownStarted) {
    _lifecycle.onConnectionClosed(nbOpenConnections());
  }
}

void HttpServer::finishShutdown() {
  _shutdownDeadlineTimer.stop();
  _maintenanceTimer.stop();
  _lifecycle.finish(_lifecycle.isForceRequested());
  _finished = true;
}

}  // namespace keelson
