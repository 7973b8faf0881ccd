#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "serve/log-level.hpp"

namespace serve {

struct TlsSettings {
  std::filesystem::path cert;
  std::filesystem::path key;
  // Only honored when the TLS listener binds port 443.
  bool redirectHttp{false};

  bool operator==(const TlsSettings&) const = default;
};

// Resolved configuration, built once at startup and then shared read-only by all server threads.
struct EffectiveConfig {
  static constexpr uint16_t kDefaultPort = 3000;
  static constexpr std::string_view kDefaultAddr = "127.0.0.1";
  static constexpr uint32_t kDefaultLogMaxFiles = 7;

  std::filesystem::path path{"."};
  std::string addr{kDefaultAddr};
  // 0 lets the OS pick an ephemeral port.
  uint16_t port{kDefaultPort};
  bool compressionEnabled{true};
  std::optional<std::filesystem::path> notFound;
  // Answer 200 with the not found body instead of 404 (single page application fallback).
  bool okOverride{false};
  LogLevel logLevel{kDefaultLogLevel};
  std::optional<std::filesystem::path> logPath;
  uint32_t logMaxFiles{kDefaultLogMaxFiles};
  std::optional<TlsSettings> tls;

  bool operator==(const EffectiveConfig&) const = default;
};

}  // namespace serve
