#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "keelson/signal.hpp"

namespace keelson {

// Per-connection backpressure tracker.
//
// Counts the outbound bytes waiting in the connection buffer. Going above the high watermark pauses the connection,
// draining down to the low watermark resumes it. While paused, body pulls and response pushes of the connection's
// exchanges register their wake signal here, and each of them is set exactly once by the resume that ends the
// episode. pause() and resume() are idempotent.
//
// Independently, the read side flag tells the connection to stop reading its socket (too much unread request body,
// or pipelining limit reached).
class FlowControlManager {
 public:
  // Throws std::invalid_argument unless lowWatermark < highWatermark.
  FlowControlManager(std::size_t lowWatermark, std::size_t highWatermark);

  FlowControlManager(const FlowControlManager&) = delete;
  FlowControlManager& operator=(const FlowControlManager&) = delete;

  void onBytesQueued(std::size_t nbBytes);

  void onBytesDrained(std::size_t nbBytes);

  // Returns true if this call started a pause episode.
  bool pause();

  // Returns true if this call ended a pause episode.
  bool resume();

  [[nodiscard]] bool isPaused() const noexcept { return _paused; }

  [[nodiscard]] std::size_t queuedBytes() const noexcept { return _queuedBytes; }

  // Registers a signal to set on the next resume. If not paused, the signal is set immediately so that a resume
  // decided before the registration is never missed.
  void addWaiter(Signal& signal);

  void removeWaiter(const Signal& signal) noexcept;

  [[nodiscard]] std::size_t nbWaiters() const noexcept { return _waiters.size(); }

  void pauseReading() noexcept { _readingPaused = true; }

  void resumeReading() noexcept { _readingPaused = false; }

  [[nodiscard]] bool isReadingPaused() const noexcept { return _readingPaused; }

  [[nodiscard]] uint64_t pauseCount() const noexcept { return _pauseCount; }

  [[nodiscard]] uint64_t resumeCount() const noexcept { return _resumeCount; }

  [[nodiscard]] std::size_t lowWatermark() const noexcept { return _lowWatermark; }

  [[nodiscard]] std::size_t highWatermark() const noexcept { return _highWatermark; }

 private:
  // Wake signals of the exchanges waiting for the end of the current pause episode.
  std::vector<Signal*> _waiters;
  std::size_t _lowWatermark;
  std::size_t _highWatermark;
  std::size_t _queuedBytes{};
  uint64_t _pauseCount{};
  uint64_t _resumeCount{};
  bool _paused{false};
  bool _readingPaused{false};
};

}  // namespace keelson
