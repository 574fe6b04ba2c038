#include "keelson/signal-handler.hpp"

#include <chrono>
#include <csignal>

namespace {

volatile std::sig_atomic_t g_stopSignal{};
volatile std::sig_atomic_t g_forceExit{};
std::chrono::milliseconds g_gracePeriod{5000};

}  // namespace

// Only async-signal-safe operations here: shutdown progress is logged by the server loop when it observes the flags.
extern "C" void KeelsonSignalHandler(int sigNum) {
  if (g_stopSignal != 0 && sigNum == SIGINT) {
    g_forceExit = 1;
  }
  g_stopSignal = sigNum;
}

namespace keelson {

void SignalHandler::Enable(std::chrono::milliseconds gracePeriod) {
  g_gracePeriod = gracePeriod;
  std::signal(SIGINT, ::KeelsonSignalHandler);
  std::signal(SIGTERM, ::KeelsonSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_stopSignal != 0; }

bool SignalHandler::IsForceExitRequested() { return g_forceExit != 0; }

std::chrono::milliseconds SignalHandler::GetGracePeriod() { return g_gracePeriod; }

void SignalHandler::ResetStopRequest() {
  g_stopSignal = 0;
  g_forceExit = 0;
}

}  // namespace keelson
