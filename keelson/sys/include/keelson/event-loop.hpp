#pragma once

#include <sys/epoll.h>

#include <cstdint>
#include <span>
#include <vector>

#include "keelson/base-fd.hpp"
#include "keelson/event.hpp"
#include "keelson/timedef.hpp"

namespace keelson {

// Thin RAII wrapper over an epoll instance.
//
// The ready-event buffer starts with kInitialCapacity slots and doubles each time a poll fills it completely.
// It never shrinks. add()/mod() report failures through their return value (already logged), letting the caller
// decide whether to drop the connection or abort.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventFd(int fd, EventBmp eventBmp) noexcept : eventBmp(eventBmp), fd(fd) {}

    EventBmp eventBmp;
    int fd;
  };

  EventLoop() noexcept = default;

  // pollTimeout bounds each poll() call. A zero initialCapacity is promoted to 1.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Registers fd, throwing std::system_error on failure.
  void addOrThrow(EventFd event) const;

  [[nodiscard]] bool add(EventFd event) const;

  [[nodiscard]] bool mod(EventFd event) const;

  // Unregisters fd. Failures are benign (fd already closed) and only logged at debug level.
  void del(int fd) const;

  // Waits up to the poll timeout and returns the ready events, valid until the next call.
  // Returns an empty span on timeout or EINTR. Unrecoverable failures are logged and also return an empty span.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  void updatePollTimeout(SysDuration pollTimeout);

 private:
  int _pollTimeoutMs = 0;
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace keelson
