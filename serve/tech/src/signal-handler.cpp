#include "serve/signal-handler.hpp"

#include <csignal>

#include "serve/log.hpp"

namespace {

volatile std::sig_atomic_t g_signalStatus{};

}  // namespace

extern "C" void ServeSignalHandler(int sigNum) {
  ::serve::log::warn("Signal {} received, shutting down", sigNum);

  g_signalStatus = sigNum;
}

namespace serve {

void SignalHandler::Enable() {
  std::signal(SIGINT, ::ServeSignalHandler);
  std::signal(SIGTERM, ::ServeSignalHandler);
  std::signal(SIGPIPE, SIG_IGN);
}

void SignalHandler::Disable() {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  std::signal(SIGPIPE, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() { g_signalStatus = 0; }

}  // namespace serve
