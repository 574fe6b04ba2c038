#pragma once

#include "keelson/base-fd.hpp"
#include "keelson/socket.hpp"

namespace keelson {

// RAII accepted client socket (non-blocking, close-on-exec).
class Connection {
 public:
  Connection() noexcept = default;

  // Accepts one pending connection from the listening socket. Evaluates to false when none is pending or accept failed.
  explicit Connection(const Socket& socket);

  explicit Connection(BaseFd&& baseFd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Disables Nagle's algorithm. Returns false on failure (logged).
  bool setTcpNoDelay() const noexcept;

  void close() noexcept { _baseFd.close(); }

  bool operator==(const Connection&) const noexcept = default;

 private:
  BaseFd _baseFd;
};

}  // namespace keelson
