#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace serve {

// Raised while resolving the effective configuration. what() is a complete, user facing message.
class ConfigError : public std::runtime_error {
 public:
  enum class Kind : int8_t { InvalidCombination, IncompleteTls, PathNotFound, ParseFailure, NotADirectory, InvalidValue };

  // 'field' requires 'otherField' to be set.
  static ConfigError InvalidCombination(std::string_view field, std::string_view otherField);

  // TLS is enabled but 'field' (cert or key) is missing.
  static ConfigError IncompleteTls(std::string_view field);

  static ConfigError PathNotFound(std::string_view field, const std::filesystem::path& path);

  static ConfigError ParseFailure(const std::filesystem::path& path, std::string_view reason);

  static ConfigError NotADirectory(std::string_view field, const std::filesystem::path& path);

  static ConfigError InvalidValue(std::string_view field, std::string_view reason);

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  // Name of the offending configuration key (for example 'tls.cert'), empty if not attached to one field.
  [[nodiscard]] const std::string& field() const noexcept { return _field; }

  // Offending path, empty if not relevant.
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return _path; }

 private:
  ConfigError(Kind kind, std::string_view field, std::filesystem::path path, const std::string& message);

  std::string _field;
  std::filesystem::path _path;
  Kind _kind;
};

}  // namespace serve
