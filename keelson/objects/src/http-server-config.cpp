#include "keelson/http-server-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "keelson/http-header.hpp"
#include "keelson/string-equal-ignore-case.hpp"

namespace keelson {

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  this->reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  this->tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxConnections(uint32_t maxConnections) {
  this->maxConnections = maxConnections;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveMode(bool on) {
  this->enableKeepAlive = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  this->maxRequestsPerConnection = maxRequests;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  this->keepAliveTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReadChunkSize(std::size_t bytes) {
  this->readChunkSize = bytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withFlowControlWatermarks(std::size_t lowWatermark, std::size_t highWatermark) {
  this->flowControlLowWatermark = lowWatermark;
  this->flowControlHighWatermark = highWatermark;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBufferedBodyBytes(std::size_t bytes) {
  this->maxBufferedBodyBytes = bytes;
  return *this;
}

HttpServerConfig& HttpServerConfig::withEventPoolCapacity(std::size_t capacity) {
  this->eventPoolCapacity = capacity;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withHeaderReadTimeout(std::chrono::milliseconds timeout) {
  this->headerReadTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withBodyReadTimeout(std::chrono::milliseconds timeout) {
  this->bodyReadTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withGracefulShutdownTimeout(std::chrono::milliseconds timeout) {
  this->gracefulShutdownTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withCycleGracePeriod(std::chrono::milliseconds gracePeriod) {
  this->cycleGracePeriod = gracePeriod;
  return *this;
}

HttpServerConfig& HttpServerConfig::withLimitMaxRequests(uint64_t maxRequests) {
  this->limitMaxRequests = maxRequests;
  return *this;
}

HttpServerConfig& HttpServerConfig::withNotifyInterval(std::chrono::milliseconds interval) {
  this->notifyInterval = interval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withDateHeader(bool on) {
  this->addDateHeader = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withGlobalHeader(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(globalHeaders,
                                 [name](const http::Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == globalHeaders.end()) {
    globalHeaders.push_back(http::Header{std::string(name), std::string(value)});
  } else {
    it->value.assign(value);
  }
  return *this;
}

HttpServerConfig& HttpServerConfig::withoutGlobalHeaders() {
  globalHeaders.clear();
  return *this;
}

void HttpServerConfig::validate() const {
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (readChunkSize == 0) {
    throw std::invalid_argument("readChunkSize must be > 0");
  }
  if (flowControlLowWatermark >= flowControlHighWatermark) {
    throw std::invalid_argument("flowControlLowWatermark must be strictly lower than flowControlHighWatermark");
  }
  if (maxBufferedBodyBytes == 0) {
    throw std::invalid_argument("maxBufferedBodyBytes must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (keepAliveTimeout.count() < 0 || headerReadTimeout.count() < 0 || bodyReadTimeout.count() < 0 ||
      gracefulShutdownTimeout.count() < 0 || cycleGracePeriod.count() < 0 || notifyInterval.count() < 0) {
    throw std::invalid_argument("timeouts must be non-negative");
  }
  for (const http::Header& header : globalHeaders) {
    if (!http::IsValidToken(header.name)) {
      throw std::invalid_argument("global header name must be a non-empty token");
    }
    if (!http::IsValidHeaderValue(header.value)) {
      throw std::invalid_argument("global header value must not contain CR, LF or NUL");
    }
  }
}

}  // namespace keelson
