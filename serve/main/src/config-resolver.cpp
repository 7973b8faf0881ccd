#include "serve/config-resolver.hpp"

#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include "serve/cli-args.hpp"
#include "serve/config-error.hpp"
#include "serve/config-file.hpp"
#include "serve/effective-config.hpp"
#include "serve/log-level.hpp"
#include "serve/log.hpp"
#include "serve/socket-address.hpp"

namespace serve {

namespace {

template <class T>
std::optional<T> FileTlsField(const ConfigFile& configFile, std::optional<T> ConfigFile::Tls::* field) {
  return configFile.tls ? (*configFile.tls).*field : std::nullopt;
}

template <class T>
std::optional<T> CliTlsField(const CliArgs& cliArgs, std::optional<T> CliArgs::Tls::* field) {
  return cliArgs.tls ? (*cliArgs.tls).*field : std::nullopt;
}

EffectiveConfig MergeSettings(const CliArgs& cli, const ConfigFile& file) {
  EffectiveConfig config;
  config.path = Merge(cli.path, file.path, ".");
  config.addr = Merge(cli.addr, file.addr, EffectiveConfig::kDefaultAddr);
  config.port = Merge(cli.port, file.port, EffectiveConfig::kDefaultPort);
  config.compressionEnabled = !Merge(cli.disableCompression, file.disableCompression, false);
  config.notFound = Merge(cli.notFound, file.notFound);
  config.okOverride = Merge(cli.ok, file.ok, false);
  config.logLevel = Merge(cli.logLevel(), file.logLevel, kDefaultLogLevel);
  config.logPath = Merge(cli.logPath, file.logPath);
  config.logMaxFiles = Merge(cli.logMaxFiles, file.logMaxFiles, EffectiveConfig::kDefaultLogMaxFiles);

  if (cli.tls || file.tls) {
    const auto cert = Merge(CliTlsField(cli, &CliArgs::Tls::cert), FileTlsField(file, &ConfigFile::Tls::cert));
    if (!cert) {
      throw ConfigError::IncompleteTls("tls.cert");
    }
    const auto key = Merge(CliTlsField(cli, &CliArgs::Tls::key), FileTlsField(file, &ConfigFile::Tls::key));
    if (!key) {
      throw ConfigError::IncompleteTls("tls.key");
    }
    config.tls.emplace(*cert, *key,
                       Merge(CliTlsField(cli, &CliArgs::Tls::redirectHttp),
                             FileTlsField(file, &ConfigFile::Tls::redirectHttp), false));
  }
  return config;
}

void CheckExists(std::string_view field, const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw ConfigError::PathNotFound(field, path);
  }
}

void Validate(const EffectiveConfig& config) {
  if (config.okOverride && !config.notFound) {
    throw ConfigError::InvalidCombination("ok", "not_found");
  }

  std::error_code ec;
  CheckExists("path", config.path);
  if (!std::filesystem::is_directory(config.path, ec)) {
    throw ConfigError::NotADirectory("path", config.path);
  }
  if (config.notFound) {
    CheckExists("not_found", *config.notFound);
  }
  if (config.tls) {
    CheckExists("tls.cert", config.tls->cert);
    CheckExists("tls.key", config.tls->key);
  }
  if (config.logPath && std::filesystem::exists(*config.logPath, ec) &&
      !std::filesystem::is_directory(*config.logPath, ec)) {
    throw ConfigError::NotADirectory("log_path", *config.logPath);
  }

  if (!SocketAddress::Parse(config.addr, config.port)) {
    throw ConfigError::InvalidValue("addr", "expected an IPv4 or IPv6 address");
  }
  // Rotated file count is a 16 bits value in the file sink.
  if (config.logMaxFiles > std::numeric_limits<uint16_t>::max()) {
    throw ConfigError::InvalidValue("log_max_files", "must not exceed 65535");
  }
}

std::filesystem::path Absolute(const std::filesystem::path& path) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    return std::filesystem::absolute(path);
  }
  return canonical;
}

void MakePathsAbsolute(EffectiveConfig& config) {
  config.path = Absolute(config.path);
  if (config.notFound) {
    config.notFound = Absolute(*config.notFound);
  }
  if (config.logPath) {
    config.logPath = Absolute(*config.logPath);
  }
  if (config.tls) {
    config.tls->cert = Absolute(config.tls->cert);
    config.tls->key = Absolute(config.tls->key);
  }
}

}  // namespace

ConfigFile ToConfigFile(const EffectiveConfig& config) {
  ConfigFile configFile;
  configFile.path = config.path;
  configFile.port = config.port;
  configFile.addr = config.addr;
  configFile.disableCompression = !config.compressionEnabled;
  configFile.notFound = config.notFound;
  configFile.ok = config.okOverride;
  configFile.logLevel = config.logLevel;
  configFile.logPath = config.logPath;
  configFile.logMaxFiles = config.logMaxFiles;
  if (config.tls) {
    configFile.tls.emplace(config.tls->cert, config.tls->key, config.tls->redirectHttp);
  }
  return configFile;
}

ResolvedConfig ResolveConfig(const CliArgs& cliArgs) {
  ResolvedConfig resolved;
  ConfigFile configFile;

  if (cliArgs.config) {
    const std::filesystem::path& configPath = *cliArgs.config;
    std::error_code ec;
    const auto status = std::filesystem::status(configPath, ec);
    if (std::filesystem::exists(status)) {
      if (!std::filesystem::is_regular_file(status)) {
        throw ConfigError::PathNotFound("config", configPath);
      }
      configFile = ConfigFile::Load(configPath);
      log::debug("Loaded configuration file {}", configPath.string());
    } else {
      resolved.configFileCreated = true;
    }
  }

  auto config = MergeSettings(cliArgs, configFile);
  Validate(config);
  MakePathsAbsolute(config);

  if (cliArgs.config) {
    if (resolved.configFileCreated) {
      ToConfigFile(config).save(*cliArgs.config);
    }
    resolved.configPath = Absolute(*cliArgs.config);
  }

  resolved.config = std::make_shared<const EffectiveConfig>(std::move(config));
  return resolved;
}

}  // namespace serve
