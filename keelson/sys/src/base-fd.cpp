#include "keelson/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "keelson/log.hpp"

namespace keelson {

BaseFd::BaseFd(BaseFd&& other) noexcept : _fd(std::exchange(other._fd, kClosedFd)) {}

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = std::exchange(other._fd, kClosedFd);
  }
  return *this;
}

void BaseFd::close() noexcept {
  const int fd = std::exchange(_fd, kClosedFd);
  if (fd == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even when close() fails, retrying on EINTR could close a reused fd.
  if (::close(fd) != 0 && errno != EINTR) {
    const auto err = errno;
    log::error("Closing fd # {} failed err={}: {}", fd, err, std::strerror(err));
    return;
  }
  log::trace("fd # {} closed", fd);
}

}  // namespace keelson
