#include "keelson/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "keelson/errno-throw.hpp"
#include "keelson/log.hpp"

namespace keelson {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("eventfd creation failed");
  }
}

void EventFd::notify() const noexcept {
  // EAGAIN means the counter is saturated: the fd is readable anyway.
  if (::eventfd_write(fd(), 1) == -1 && errno != EAGAIN) {
    const auto err = errno;
    log::error("Notification on eventfd # {} lost err={}: {}", fd(), err, std::strerror(err));
  }
}

uint64_t EventFd::drain() const noexcept {
  eventfd_t count = 0;
  if (::eventfd_read(fd(), &count) == -1) {
    if (errno != EAGAIN) {
      const auto err = errno;
      log::error("Draining eventfd # {} failed err={}: {}", fd(), err, std::strerror(err));
    }
    return 0;
  }
  return count;
}

}  // namespace keelson
