#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "keelson/transport.hpp"

namespace keelson::test {

// In-memory peer of a FakeTransport, kept by the test while the connection owns the transport.
struct FakePeer {
  // Bytes the connection will read next.
  std::string inbound;
  // Everything the connection wrote so far.
  std::string written;
  // Number of bytes writes may still accept before reporting WriteReady (a full socket buffer).
  std::size_t writeBudget{std::numeric_limits<std::size_t>::max()};
  // Makes every write fail as if the peer reset the connection.
  bool failWrites{false};
  // Once inbound is consumed, reads report the orderly shutdown of the peer.
  bool closed{false};
  std::size_t nbWrites{};

  // Returns and clears what was written.
  std::string takeWritten();
};

class FakeTransport : public ITransport {
 public:
  explicit FakeTransport(std::shared_ptr<FakePeer> peer) noexcept : _peer(std::move(peer)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  std::shared_ptr<FakePeer> _peer;
};

}  // namespace keelson::test
