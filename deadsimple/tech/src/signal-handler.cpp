#include "deadsimple/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

// Only async-signal-safe work here: the signal is reported by the loop polling it.
extern "C" void DeadsimpleSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace deadsimple {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::DeadsimpleSignalHandler);
  std::signal(SIGTERM, ::DeadsimpleSignalHandler);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

int SignalHandler::ReceivedSignal() { return g_signalStatus; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace deadsimple
