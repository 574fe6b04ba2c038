#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace keelson {

// Why a non-blocking transport call stopped short.
enum class TransportHint : uint8_t {
  None,        // done (a read of 0 bytes is the peer's orderly close)
  ReadReady,   // nothing to read for now
  WriteReady,  // socket send buffer is full
  Error        // connection is unusable (reset, broken pipe)
};

// Byte stream under a connection handler. Tests drive handlers through an in-memory implementation.
class ITransport {
 public:
  struct TransportResult {
    std::size_t bytesProcessed;
    TransportHint want;
  };

  virtual ~ITransport() = default;

  // Reads at most len bytes without blocking.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Writes until done or until the socket refuses more: a short count always comes with WriteReady or Error.
  virtual TransportResult write(std::string_view data) = 0;
};

// Transport of an accepted TCP socket. The socket fd is owned by its Connection.
class PlainTransport final : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  int _fd;
};

}  // namespace keelson
