#include "serve/config-file.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "serve/config-error.hpp"
#include "serve/log-level.hpp"
#include "serve/log.hpp"

namespace serve {

namespace {

constexpr std::string_view kHeaderComment = "# Configuration for serve\n\n";

class TableReader {
 public:
  TableReader(const toml::table& tbl, std::string_view prefix, const std::filesystem::path& sourcePath)
      : _tbl(tbl), _prefix(prefix), _sourcePath(sourcePath) {}

  template <class T>
  std::optional<T> get(std::string_view key) const {
    const toml::node* node = _tbl.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    auto val = node->value_exact<T>();
    if (!val) {
      throw ConfigError::ParseFailure(
          _sourcePath, std::format("'{}{}' has type {}, expected {}", _prefix, key, TypeName(node->type()), TypeName<T>()));
    }
    return val;
  }

  std::optional<std::filesystem::path> getPath(std::string_view key) const {
    auto str = get<std::string>(key);
    if (!str) {
      return std::nullopt;
    }
    return std::filesystem::path(std::move(*str));
  }

  template <class IntType>
  std::optional<IntType> getInteger(std::string_view key) const {
    const auto val = get<int64_t>(key);
    if (!val) {
      return std::nullopt;
    }
    if (*val < 0 || *val > static_cast<int64_t>(std::numeric_limits<IntType>::max())) {
      throw ConfigError::ParseFailure(_sourcePath, std::format("'{}{}' value {} is out of range [0, {}]", _prefix, key,
                                                               *val, std::numeric_limits<IntType>::max()));
    }
    return static_cast<IntType>(*val);
  }

 private:
  static std::string_view TypeName(toml::node_type type) {
    switch (type) {
      case toml::node_type::string:
        return "string";
      case toml::node_type::integer:
        return "integer";
      case toml::node_type::floating_point:
        return "float";
      case toml::node_type::boolean:
        return "boolean";
      case toml::node_type::table:
        return "table";
      case toml::node_type::array:
        return "array";
      default:
        return "date/time";
    }
  }

  template <class T>
  static std::string_view TypeName() {
    if constexpr (std::is_same_v<T, std::string>) {
      return "string";
    } else if constexpr (std::is_same_v<T, bool>) {
      return "boolean";
    } else {
      return "integer";
    }
  }

  const toml::table& _tbl;
  std::string_view _prefix;
  const std::filesystem::path& _sourcePath;
};

ConfigFile FromTable(const toml::table& tbl, const std::filesystem::path& sourcePath) {
  TableReader reader(tbl, "", sourcePath);

  ConfigFile configFile;
  configFile.path = reader.getPath("path");
  configFile.port = reader.getInteger<uint16_t>("port");
  configFile.addr = reader.get<std::string>("addr");
  configFile.disableCompression = reader.get<bool>("disable_compression");
  configFile.notFound = reader.getPath("not_found");
  configFile.ok = reader.get<bool>("ok");
  if (auto levelName = reader.get<std::string>("log_level")) {
    configFile.logLevel = ParseLogLevel(*levelName);
    if (!configFile.logLevel) {
      throw ConfigError::InvalidValue("log_level", std::format("unknown level '{}'", *levelName));
    }
  }
  configFile.logPath = reader.getPath("log_path");
  configFile.logMaxFiles = reader.getInteger<uint32_t>("log_max_files");

  if (const toml::node* tlsNode = tbl.get("tls")) {
    const toml::table* tlsTbl = tlsNode->as_table();
    if (tlsTbl == nullptr) {
      throw ConfigError::ParseFailure(sourcePath, "'tls' must be a table");
    }
    TableReader tlsReader(*tlsTbl, "tls.", sourcePath);
    auto& tls = configFile.tls.emplace();
    tls.cert = tlsReader.getPath("cert");
    tls.key = tlsReader.getPath("key");
    tls.redirectHttp = tlsReader.get<bool>("redirect_http");
  }
  return configFile;
}

}  // namespace

ConfigFile ConfigFile::Load(const std::filesystem::path& filePath) {
  try {
    const toml::table tbl = toml::parse_file(filePath.string());
    return FromTable(tbl, filePath);
  } catch (const toml::parse_error& err) {
    throw ConfigError::ParseFailure(filePath, std::format("{} (line {}, column {})", err.description(),
                                                          err.source().begin.line, err.source().begin.column));
  }
}

ConfigFile ConfigFile::Parse(std::string_view content, const std::filesystem::path& sourcePath) {
  try {
    const toml::table tbl = toml::parse(content, sourcePath.string());
    return FromTable(tbl, sourcePath);
  } catch (const toml::parse_error& err) {
    throw ConfigError::ParseFailure(sourcePath, std::format("{} (line {}, column {})", err.description(),
                                                            err.source().begin.line, err.source().begin.column));
  }
}

std::string ConfigFile::serialize() const {
  toml::table tbl;
  if (path) {
    tbl.insert("path", path->string());
  }
  if (port) {
    tbl.insert("port", static_cast<int64_t>(*port));
  }
  if (addr) {
    tbl.insert("addr", *addr);
  }
  if (disableCompression) {
    tbl.insert("disable_compression", *disableCompression);
  }
  if (notFound) {
    tbl.insert("not_found", notFound->string());
  }
  if (ok) {
    tbl.insert("ok", *ok);
  }
  if (logLevel) {
    tbl.insert("log_level", std::string(LogLevelName(*logLevel)));
  }
  if (logPath) {
    tbl.insert("log_path", logPath->string());
  }
  if (logMaxFiles) {
    tbl.insert("log_max_files", static_cast<int64_t>(*logMaxFiles));
  }
  if (tls) {
    toml::table tlsTbl;
    if (tls->cert) {
      tlsTbl.insert("cert", tls->cert->string());
    }
    if (tls->key) {
      tlsTbl.insert("key", tls->key->string());
    }
    if (tls->redirectHttp) {
      tlsTbl.insert("redirect_http", *tls->redirectHttp);
    }
    tbl.insert("tls", std::move(tlsTbl));
  }

  std::ostringstream oss;
  oss << kHeaderComment << tbl << '\n';
  return std::move(oss).str();
}

void ConfigFile::save(const std::filesystem::path& filePath) const {
  if (filePath.has_parent_path()) {
    std::filesystem::create_directories(filePath.parent_path());
  }
  std::ofstream ofs(filePath, std::ios::out | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error(std::format("Unable to open '{}' for writing", filePath.string()));
  }
  ofs << serialize();
  ofs.close();
  if (!ofs) {
    throw std::runtime_error(std::format("Unable to write configuration to '{}'", filePath.string()));
  }
  log::debug("Configuration written to '{}'", filePath.string());
}

}  // namespace serve
