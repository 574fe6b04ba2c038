#pragma once

#include <chrono>

namespace keelson {

// Process-wide SIGINT / SIGTERM handling.
// The first signal requests a graceful shutdown. A second SIGINT received while the shutdown is already requested
// escalates to a forced exit: open connections are closed immediately and the shutdown hook is skipped.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs the handlers. gracePeriod bounds the graceful shutdown started by a signal (0: no limit).
  static void Enable(std::chrono::milliseconds gracePeriod = std::chrono::milliseconds{5000});

  // Restores default signal dispositions.
  static void Disable();

  static bool IsStopRequested();

  static bool IsForceExitRequested();

  static std::chrono::milliseconds GetGracePeriod();

 private:
  friend class SignalHandlerTest;

  // Clears both flags so that several tests can raise signals in the same process.
  static void ResetStopRequest();
};

}  // namespace keelson
