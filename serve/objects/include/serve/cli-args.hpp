#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "serve/log-level.hpp"

namespace serve {

// Overrides given on the command line. Unset fields defer to the configuration file, then to defaults.
struct CliArgs {
  // Payload of the 'tls' subcommand.
  struct Tls {
    std::optional<std::filesystem::path> cert;
    std::optional<std::filesystem::path> key;
    // Flags can only be switched on from the command line, absence means "unset".
    std::optional<bool> redirectHttp;

    bool operator==(const Tls&) const = default;
  };

  // Net verbosity shift from the default level, or nullopt if neither -v nor -q was given.
  [[nodiscard]] std::optional<LogLevel> logLevel() const noexcept {
    if (verbose == 0 && quiet == 0) {
      return std::nullopt;
    }
    return ShiftVerbosity(kDefaultLogLevel, static_cast<int>(verbose) - static_cast<int>(quiet));
  }

  std::optional<std::filesystem::path> config;
  std::optional<std::filesystem::path> path;
  std::optional<uint16_t> port;
  std::optional<std::string> addr;
  std::optional<bool> disableCompression;
  std::optional<std::filesystem::path> notFound;
  std::optional<bool> ok;
  std::optional<std::filesystem::path> logPath;
  std::optional<uint32_t> logMaxFiles;
  uint32_t verbose{};
  uint32_t quiet{};
  std::optional<Tls> tls;

  bool operator==(const CliArgs&) const = default;
};

}  // namespace serve
