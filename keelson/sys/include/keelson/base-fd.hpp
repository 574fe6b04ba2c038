#pragma once

namespace keelson {

// Sole owner of a descriptor: listening socket, client connection, epoll instance, eventfd or timerfd.
class BaseFd {
 public:
  static constexpr int kClosedFd = -1;

  explicit BaseFd(int fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd& operator=(const BaseFd&) = delete;

  BaseFd(BaseFd&& other) noexcept;
  // The descriptor previously owned is closed.
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] int fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Used to stop listening while connections drain. No-op once closed.
  void close() noexcept;

 private:
  int _fd;
};

}  // namespace keelson
