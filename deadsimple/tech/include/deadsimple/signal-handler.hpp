#pragma once

namespace deadsimple {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request the accept loop to stop.
  static void Enable();

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Number of the last termination signal received, 0 if none.
  static int ReceivedSignal();

 private:
  friend class SignalHandlerTest;

  // Resets the stop-requested flag so that multiple test runs can share the same process.
  static void ResetStopRequest();
};

}  // namespace deadsimple
