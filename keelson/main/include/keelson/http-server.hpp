#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "keelson/connection-handler.hpp"
#include "keelson/connection.hpp"
#include "keelson/event-fd.hpp"
#include "keelson/event-loop.hpp"
#include "keelson/event-pool.hpp"
#include "keelson/http-server-config.hpp"
#include "keelson/lifecycle-controller.hpp"
#include "keelson/request-response-cycle.hpp"
#include "keelson/server-state.hpp"
#include "keelson/server-stats.hpp"
#include "keelson/socket.hpp"
#include "keelson/timedef.hpp"
#include "keelson/timer-fd.hpp"

namespace keelson {

// HttpServer
//  - Single-threaded event loop: one instance == one epoll reactor running in the thread calling run() / runUntil(),
//    or in the background thread of start().
//  - Not internally synchronized. Only stop(), forceStop(), beginShutdown(), post() and lifecycle().state() may be
//    called from another thread while the loop runs.
//  - A server runs once: after its lifecycle reached Stopped, it cannot be started again.
//  - The listening socket is bound at construction, so that port() is valid immediately.
class HttpServer {
 public:
  using NotifyCallback = std::function<void(const ServerStats&)>;

  // AsyncHandle: RAII wrapper for non-blocking server execution
  // ------------------------------------------------------------
  // Returned by start() to manage the background thread running the event loop.
  // Destroying the handle (or calling stop()) requests a graceful shutdown and joins the thread.
  //
  //   HttpServer server(cfg, app);
  //   auto handle = server.start();
  //   // ... talk to server.port() ...
  //   handle.stop();
  //   handle.rethrowIfError();
  class AsyncHandle {
   public:
    AsyncHandle(const AsyncHandle&) = delete;
    AsyncHandle& operator=(const AsyncHandle&) = delete;

    AsyncHandle(AsyncHandle&&) noexcept = default;
    AsyncHandle& operator=(AsyncHandle&&) noexcept = default;

    ~AsyncHandle();

    // Requests a graceful shutdown and blocks until the event loop thread exited.
    void stop() noexcept;

    // Rethrows the exception that terminated the event loop thread, if any.
    void rethrowIfError();

    [[nodiscard]] bool started() const noexcept { return _thread.joinable(); }

   private:
    friend class HttpServer;

    AsyncHandle(std::jthread thread, std::shared_ptr<std::exception_ptr> error);

    std::jthread _thread;
    std::shared_ptr<std::exception_ptr> _error;
  };

  // Validates the configuration, binds and listens. Throws std::invalid_argument or std::system_error.
  HttpServer(HttpServerConfig config, Application application);

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  ~HttpServer();

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  // Blocks until the server stopped. Throws std::runtime_error if the startup hook failed.
  void run();

  // Like run(), but starts a graceful shutdown as soon as predicate returns true. The predicate is checked at least
  // every pollInterval.
  void runUntil(const std::function<bool()>& predicate);

  // Runs the event loop in a background thread.
  [[nodiscard]] AsyncHandle start();

  // Requests a graceful shutdown bounded by gracefulShutdownTimeout. Thread safe, returns immediately.
  void stop() noexcept;

  // Requests an immediate shutdown: connections are closed at once and the shutdown hook is skipped.
  void forceStop() noexcept;

  // Requests a graceful shutdown bounded by maxWait (0: wait for every exchange).
  void beginShutdown(std::chrono::milliseconds maxWait) noexcept;

  // Invoked from the event loop thread every notifyInterval while serving.
  void setNotifyCallback(NotifyCallback callback);

  // Runs task on the event loop thread, from any thread. This is how an application coroutine suspended on its own
  // awaitable (a timer, a worker thread) gets resumed:
  //
  //   std::thread([&server, handle] { server.post([handle] { handle.resume(); }); }).detach();
  //
  // Tasks posted after the loop stopped never run.
  void post(std::function<void()> task);

  // Snapshot of the server statistics. Call it from the loop thread, or once the server is stopped.
  [[nodiscard]] ServerStats stats() const;

  [[nodiscard]] LifecycleController& lifecycle() noexcept { return _lifecycle; }

  [[nodiscard]] const ServerState& serverState() const noexcept { return _serverState; }

 private:
  struct ConnectionEntry {
    Connection cnx;
    std::unique_ptr<ConnectionHandler> handler;
    bool waitingWritable{false};
  };

  using ConnectionMap = std::unordered_map<int, ConnectionEntry>;

  void initListener();

  void prepareRun();

  void eventLoop();

  void acceptNewConnections();

  void runPostedTasks();

  void serviceConnection(int fd, EventBmp eventBmp);

  // Applies what the handler needs after it ran (resumed reading, write interest, closure). Returns the next iterator.
  ConnectionMap::iterator refreshConnection(ConnectionMap::iterator cnxIt);

  ConnectionMap::iterator closeConnection(ConnectionMap::iterator cnxIt);

  void sweepConnections();

  void checkProcessSignals();

  void checkRequestLimit();

  void onShutdownRequested();

  void cancelConnections();

  void finishShutdown();

  void reportRemainingConnections();

  [[nodiscard]] std::size_t nbOpenConnections() const noexcept { return _connections.size() + _lingering.size(); }

  HttpServerConfig _config;
  Application _application;
  ServerState _serverState;
  EventPool _eventPool;
  ServerStats _stats;
  LifecycleController _lifecycle;
  Socket _listenSocket;
  EventLoop _eventLoop;
  TimerFd _maintenanceTimer;
  TimerFd _shutdownDeadlineTimer;
  TimerFd _notifyTimer;
  NotifyCallback _notifyCallback;
  EventFd _postedFd;
  std::mutex _postedMutex;
  std::vector<std::function<void()>> _posted;
  ConnectionMap _connections;
  // Handlers whose connection is closed but with exchanges still running (bounded by cycleGracePeriod).
  std::vector<std::unique_ptr<ConnectionHandler>> _lingering;
  SteadyTimePoint _shutdownDeadline;
  uint64_t _nextConnectionId{};
  bool _shutdownStarted{false};
  bool _finished{false};
};

}  // namespace keelson
