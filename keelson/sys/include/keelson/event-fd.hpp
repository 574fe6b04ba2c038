#pragma once

#include <cstdint>

#include "keelson/base-fd.hpp"

namespace keelson {

// Counter that makes the event loop wake up: shutdown requests and tasks posted from other threads, or the "last
// connection closed" notification. Readable as long as the counter is not zero.
class EventFd {
 public:
  EventFd();

  // Adds one to the counter. Thread safe.
  void notify() const noexcept;

  // Resets the counter and returns its previous value (0 if there was nothing to consume).
  uint64_t drain() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace keelson
