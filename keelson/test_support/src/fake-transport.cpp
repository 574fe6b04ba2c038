#include "keelson/fake-transport.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

#include "keelson/transport.hpp"

namespace keelson::test {

std::string FakePeer::takeWritten() { return std::exchange(written, {}); }

ITransport::TransportResult FakeTransport::read(char* buf, std::size_t len) {
  if (_peer->inbound.empty()) {
    return {0, _peer->closed ? TransportHint::None : TransportHint::ReadReady};
  }
  const std::size_t nbRead = std::min(len, _peer->inbound.size());
  std::memcpy(buf, _peer->inbound.data(), nbRead);
  _peer->inbound.erase(0, nbRead);
  return {nbRead, TransportHint::None};
}

ITransport::TransportResult FakeTransport::write(std::string_view data) {
  ++_peer->nbWrites;
  if (_peer->failWrites) {
    return {0, TransportHint::Error};
  }
  const std::size_t nbWritten = std::min(data.size(), _peer->writeBudget);
  _peer->writeBudget -= nbWritten;
  _peer->written.append(data.substr(0, nbWritten));
  return {nbWritten, nbWritten < data.size() ? TransportHint::WriteReady : TransportHint::None};
}

}  // namespace keelson::test
