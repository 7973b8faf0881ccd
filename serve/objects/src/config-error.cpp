#include "serve/config-error.hpp"

#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace serve {

ConfigError::ConfigError(Kind kind, std::string_view field, std::filesystem::path path, const std::string& message)
    : std::runtime_error(message), _field(field), _path(std::move(path)), _kind(kind) {}

ConfigError ConfigError::InvalidCombination(std::string_view field, std::string_view otherField) {
  return {Kind::InvalidCombination, field, {}, std::format("'{}' requires '{}' to be set", field, otherField)};
}

ConfigError ConfigError::IncompleteTls(std::string_view field) {
  return {Kind::IncompleteTls, field, {}, std::format("TLS is enabled but '{}' is missing", field)};
}

ConfigError ConfigError::PathNotFound(std::string_view field, const std::filesystem::path& path) {
  return {Kind::PathNotFound, field, path, std::format("'{}': path '{}' does not exist", field, path.string())};
}

ConfigError ConfigError::ParseFailure(const std::filesystem::path& path, std::string_view reason) {
  return {Kind::ParseFailure, {}, path, std::format("Unable to parse config file '{}': {}", path.string(), reason)};
}

ConfigError ConfigError::NotADirectory(std::string_view field, const std::filesystem::path& path) {
  return {Kind::NotADirectory, field, path, std::format("'{}': '{}' is not a directory", field, path.string())};
}

ConfigError ConfigError::InvalidValue(std::string_view field, std::string_view reason) {
  return {Kind::InvalidValue, field, {}, std::format("Invalid value for '{}': {}", field, reason)};
}

}  // namespace serve
