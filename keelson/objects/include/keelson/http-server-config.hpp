#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "keelson/http-header.hpp"

namespace keelson {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port, retrievable afterwards through
  // HttpServer::port().
  uint16_t port{0};

  // Enables SO_REUSEPORT so that several independent server processes can share the same port. Default: false.
  bool reusePort{false};

  // Disables Nagle's algorithm on accepted sockets, favoring latency of small responses. Default: false.
  bool tcpNoDelay{false};

  // Maximum number of simultaneously open connections. Connections accepted beyond it are closed immediately.
  // 0 means unlimited. Default: unlimited.
  uint32_t maxConnections{0};

  // ===========================================
  // Keep-Alive / connection lifecycle controls
  // ===========================================
  // Whether persistent connections are allowed at all. When false every response carries "Connection: close".
  bool enableKeepAlive{true};

  // Maximum number of requests served on a single persistent connection before it is closed.
  uint32_t maxRequestsPerConnection{100};

  // Lifetime of an idle keep-alive connection waiting for its next request. Default: 5000 ms.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // ============================
  // Request parsing & body limits
  // ============================
  // Maximum size of the request head (request line + headers + empty line). Exceeding it yields a 431 and closure.
  // Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum decoded size of a request body. Exceeding it yields a 413 and closure. Default: 64 MiB.
  std::size_t maxBodyBytes{std::size_t{64} << 20};

  // Number of bytes requested from the transport per read call. Default: 4 KiB.
  std::size_t readChunkSize{4096};

  // ==================================
  // Flow control (backpressure) tuning
  // ==================================
  // Outbound bytes queued for one connection above which the connection is paused: body pulls and response pushes
  // of its exchanges block until the queue drains to the low watermark. Must be greater than the low watermark.
  // Default: 64 KiB.
  std::size_t flowControlHighWatermark{std::size_t{64} << 10};

  // Queued outbound bytes at which a paused connection resumes. Default: 16 KiB.
  std::size_t flowControlLowWatermark{std::size_t{16} << 10};

  // Unread request body bytes buffered for an exchange above which the server stops reading the socket until the
  // application pulls. Default: 64 KiB.
  std::size_t maxBufferedBodyBytes{std::size_t{64} << 10};

  // Number of idle wake-up signals kept for reuse by the event pool. 0 disables pooling. Default: 1000.
  std::size_t eventPoolCapacity{1000};

  // ===========================================
  // Event loop polling / timeouts
  // ===========================================
  // Maximum duration of a single epoll_wait and period of the maintenance timer (idle sweeps, timeouts, process
  // signals). Default: 500 ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Time allowed to receive a complete request head from its first byte. Exceeding it yields a 408 and closure.
  // 0 disables the timeout. Default: disabled.
  std::chrono::milliseconds headerReadTimeout{std::chrono::milliseconds{0}};

  // Silence tolerated while a request body is still expected. Exceeding it is treated as a client timeout: 408 if no
  // response byte was written yet, abrupt close otherwise. 0 disables the timeout. Default: 30 s.
  std::chrono::milliseconds bodyReadTimeout{std::chrono::milliseconds{30000}};

  // ===========================
  // Shutdown / server lifecycle
  // ===========================
  // Upper bound for a graceful shutdown. Connections still open when it elapses are force closed.
  // 0 means wait for all exchanges to finish. Default: 0.
  std::chrono::milliseconds gracefulShutdownTimeout{std::chrono::milliseconds{0}};

  // Time an exchange whose client disconnected may keep running before it is destroyed. Default: 5000 ms.
  std::chrono::milliseconds cycleGracePeriod{std::chrono::milliseconds{5000}};

  // Number of served requests after which the server shuts itself down gracefully. 0 means unlimited.
  uint64_t limitMaxRequests{0};

  // Period of the notify callback (see HttpServer::setNotifyCallback). Default: 30 s.
  std::chrono::milliseconds notifyInterval{std::chrono::milliseconds{30000}};

  // ================
  // Response headers
  // ================
  // Whether every response carries a Date header.
  bool addDateHeader{true};

  // Headers added to every response (including server generated errors) unless the application sets a header with
  // the same name.
  std::vector<http::Header> globalHeaders{{"Server", "keelson"}};

  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withMaxConnections(uint32_t maxConnections);

  HttpServerConfig& withKeepAliveMode(bool on = true);

  HttpServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  HttpServerConfig& withReadChunkSize(std::size_t bytes);

  HttpServerConfig& withFlowControlWatermarks(std::size_t lowWatermark, std::size_t highWatermark);

  HttpServerConfig& withMaxBufferedBodyBytes(std::size_t bytes);

  HttpServerConfig& withEventPoolCapacity(std::size_t capacity);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds interval);

  HttpServerConfig& withHeaderReadTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withBodyReadTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withGracefulShutdownTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withCycleGracePeriod(std::chrono::milliseconds gracePeriod);

  HttpServerConfig& withLimitMaxRequests(uint64_t maxRequests);

  HttpServerConfig& withNotifyInterval(std::chrono::milliseconds interval);

  HttpServerConfig& withDateHeader(bool on = true);

  // Appends (or replaces, matching the name case-insensitively) a global header.
  HttpServerConfig& withGlobalHeader(std::string_view name, std::string_view value);

  HttpServerConfig& withoutGlobalHeaders();

  bool operator==(const HttpServerConfig&) const = default;
};

}  // namespace keelson
