#pragma once

namespace serve {

// Process-wide termination flag driven by SIGINT / SIGTERM.
// Event loops poll IsStopRequested() on each tick and close their listeners and connections
// without waiting for in-flight requests.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs handlers for SIGINT and SIGTERM, and ignores SIGPIPE so that writes on a
  // connection closed by the peer surface as EPIPE instead of killing the process.
  static void Enable();

  // Restores default behavior for SIGINT, SIGTERM and SIGPIPE.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

 private:
  friend class SignalHandlerTest;

  // Resets the stop-requested flag, so that several tests can run in the same process.
  static void ResetStopRequest();
};

}  // namespace serve
