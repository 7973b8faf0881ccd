#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "serve/cli-parser.hpp"
#include "serve/config-resolver.hpp"
#include "serve/logging-setup.hpp"
#include "serve/server-bootstrap.hpp"
#include "serve/signal-handler.hpp"
#include "serve/version.hpp"

namespace {

constexpr int kUsageErrorExitCode = 2;

}  // namespace

int main(int argc, char** argv) {
  serve::SignalHandler::Enable();

  serve::CommandLine cmdLine;
  try {
    const std::vector<const char*> args(argv + std::min(argc, 1), argv + argc);
    cmdLine = serve::ParseCommandLine(args);
  } catch (const std::invalid_argument& ex) {
    std::cerr << "Error: " << ex.what() << "\n\nFor more information, try '--help'.\n";
    return kUsageErrorExitCode;
  }

  switch (cmdLine.action) {
    case serve::CommandLine::Action::Help:
      std::cout << cmdLine.helpText;
      return EXIT_SUCCESS;
    case serve::CommandLine::Action::Version:
      std::cout << serve::fullVersionString() << '\n';
      return EXIT_SUCCESS;
    default:
      break;
  }

  try {
    const auto resolved = serve::ResolveConfig(cmdLine.args);
    if (resolved.configFileCreated) {
      const auto configPath = resolved.configPath->string();
      std::cout << "Configuration file created at: " << configPath << "\nYou can run\nserve --config " << configPath
                << "\nto use it.\n\n";
    }

    serve::SetupLogging(*resolved.config);

    serve::ServerBootstrap bootstrap(resolved.config);
    bootstrap.run();
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
