#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <utility>

#include "serve/cli-args.hpp"
#include "serve/config-file.hpp"
#include "serve/effective-config.hpp"

namespace serve {

// Field precedence: command line, then configuration file, then built-in default.
template <class T, class U>
T Merge(const std::optional<T>& cliValue, const std::optional<T>& fileValue, U&& defaultValue) {
  if (cliValue) {
    return *cliValue;
  }
  if (fileValue) {
    return *fileValue;
  }
  return T(std::forward<U>(defaultValue));
}

// Same precedence for settings without default.
template <class T>
std::optional<T> Merge(const std::optional<T>& cliValue, const std::optional<T>& fileValue) {
  return cliValue ? cliValue : fileValue;
}

struct ResolvedConfig {
  std::shared_ptr<const EffectiveConfig> config;
  // Configuration file in use, if any.
  std::optional<std::filesystem::path> configPath;
  // True if the configuration file did not exist and has just been written.
  bool configFileCreated{false};
};

// Builds the effective configuration from the command line and the configuration file it names (if any).
//  - Existing file: each setting given on the command line overrides the one from the file.
//  - Missing file: the resolved configuration is written to it, so that later runs can use it alone.
//    An existing file is never rewritten.
// Paths of the effective configuration are absolute. Throws ConfigError.
ResolvedConfig ResolveConfig(const CliArgs& cliArgs);

// Settings file equivalent to 'config': every value is written, including defaults.
ConfigFile ToConfigFile(const EffectiveConfig& config);

}  // namespace serve
