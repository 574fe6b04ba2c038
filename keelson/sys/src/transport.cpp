#include "keelson/transport.hpp"

#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

namespace keelson {

namespace {

static_assert(EAGAIN == EWOULDBLOCK);

// Hint for a failed socket call, given what the call was waiting for.
TransportHint HintFromErrno(int err, TransportHint retryHint) noexcept {
  return err == EAGAIN ? retryHint : TransportHint::Error;
}

}  // namespace

ITransport::TransportResult PlainTransport::read(char* buf, std::size_t len) {
  ssize_t nbRead;
  do {
    nbRead = ::recv(_fd, buf, len, 0);
  } while (nbRead == -1 && errno == EINTR);
  if (nbRead == -1) {
    return {0, HintFromErrno(errno, TransportHint::ReadReady)};
  }
  return {static_cast<std::size_t>(nbRead), TransportHint::None};
}

ITransport::TransportResult PlainTransport::write(std::string_view data) {
  std::size_t nbWritten = 0;
  while (nbWritten < data.size()) {
    // MSG_NOSIGNAL: a vanished peer surfaces as EPIPE instead of SIGPIPE.
    const ssize_t ret = ::send(_fd, data.data() + nbWritten, data.size() - nbWritten, MSG_NOSIGNAL);
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      return {nbWritten, HintFromErrno(errno, TransportHint::WriteReady)};
    }
    nbWritten += static_cast<std::size_t>(ret);
  }
  return {nbWritten, TransportHint::None};
}

}  // namespace keelson
