#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "serve/log-level.hpp"

namespace serve {

// Persisted settings, as stored in the TOML configuration file. Every field is optional: a missing key means
// "not set in the file" and lets the command line or the built-in default decide.
struct ConfigFile {
  struct Tls {
    std::optional<std::filesystem::path> cert;
    std::optional<std::filesystem::path> key;
    std::optional<bool> redirectHttp;

    bool operator==(const Tls&) const = default;
  };

  // Loads and parses 'filePath'. Unknown keys are ignored.
  // Throws ConfigError (ParseFailure for malformed TOML or wrongly typed values, InvalidValue for bad log levels).
  static ConfigFile Load(const std::filesystem::path& filePath);

  // Same as Load, from in-memory TOML content. 'sourcePath' is only used in error messages.
  static ConfigFile Parse(std::string_view content, const std::filesystem::path& sourcePath = "<memory>");

  // TOML representation, starting with a comment header. Only set fields are written.
  [[nodiscard]] std::string serialize() const;

  // Writes serialize() to 'filePath', creating parent directories as needed.
  // Throws std::system_error / std::runtime_error on I/O failure.
  void save(const std::filesystem::path& filePath) const;

  std::optional<std::filesystem::path> path;
  std::optional<uint16_t> port;
  std::optional<std::string> addr;
  std::optional<bool> disableCompression;
  std::optional<std::filesystem::path> notFound;
  std::optional<bool> ok;
  std::optional<LogLevel> logLevel;
  std::optional<std::filesystem::path> logPath;
  std::optional<uint32_t> logMaxFiles;
  std::optional<Tls> tls;

  bool operator==(const ConfigFile&) const = default;
};

}  // namespace serve
