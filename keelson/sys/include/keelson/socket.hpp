#pragma once

#include <cstdint>

#include "keelson/base-fd.hpp"

namespace keelson {

// RAII IPv4 TCP socket, used as the listening socket of the server.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Binds to INADDR_ANY:port and listens. A zero port picks an ephemeral one, written back into port.
  // Throws std::system_error on failure.
  void bindAndListen(bool reusePort, uint16_t& port);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace keelson
