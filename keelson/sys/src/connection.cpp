#include "keelson/connection.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "keelson/base-fd.hpp"
#include "keelson/log.hpp"
#include "keelson/socket.hpp"

namespace keelson {

namespace {

int AcceptConnectionFd(int socketFd) {
  sockaddr_in inAddr{};
  socklen_t inLen = sizeof(inAddr);
  const int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("No more pending connection on socket fd # {}", socketFd);
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, std::strerror(savedErr));
    }
    return BaseFd::kClosedFd;
  }
  log::debug("Connection fd # {} opened", fd);
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(AcceptConnectionFd(socket.fd())) {}

Connection::Connection(BaseFd&& baseFd) noexcept : _baseFd(std::move(baseFd)) {}

bool Connection::setTcpNoDelay() const noexcept {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd(), IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) != 0) {
    log::error("setsockopt(TCP_NODELAY) failed for fd # {}: {}", fd(), std::strerror(errno));
    return false;
  }
  return true;
}

}  // namespace keelson
