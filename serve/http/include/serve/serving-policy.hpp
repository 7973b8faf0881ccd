#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "serve/effective-config.hpp"

namespace serve {

// Raised when a request path cannot be mapped inside the served directory.
class ServingError : public std::runtime_error {
 public:
  enum class Kind : int8_t {
    OutOfRoot,      // '..' segment, NUL byte or backslash: answered with 403
    MalformedPath,  // invalid percent-encoding: answered with 400
  };

  ServingError(Kind kind, const std::string& message) : std::runtime_error(message), _kind(kind) {}

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

 private:
  Kind _kind;
};

namespace disposition {

// Existing regular file under the root.
struct Serve {
  std::filesystem::path path;

  bool operator==(const Serve&) const = default;
};

// Nothing to serve and no fallback configured: 404 with an empty body.
struct NotFoundEmpty {
  bool operator==(const NotFoundEmpty&) const = default;
};

// Nothing to serve: 404 with the content of the fallback file.
struct NotFoundWithBody {
  std::filesystem::path path;

  bool operator==(const NotFoundWithBody&) const = default;
};

// Nothing to serve: 200 with the content of the fallback file (single page application mode).
struct OkOverride {
  std::filesystem::path path;

  bool operator==(const OkOverride&) const = default;
};

// Directory with an index requested without trailing slash: 307 to the same path with a slash.
struct RedirectToDirectory {
  std::string location;

  bool operator==(const RedirectToDirectory&) const = default;
};

}  // namespace disposition

using Disposition = std::variant<disposition::Serve, disposition::NotFoundEmpty, disposition::NotFoundWithBody,
                                 disposition::OkOverride, disposition::RedirectToDirectory>;

// Maps request paths to dispositions, according to the served directory and the fallback settings.
// Immutable after construction, safe to share between threads.
class ServingPolicy {
 public:
  static constexpr std::string_view kIndexFile = "index.html";

  explicit ServingPolicy(std::shared_ptr<const EffectiveConfig> config);

  // 'requestPath' is the raw (percent-encoded) path of the request target, without query string.
  // Throws ServingError if the path escapes the root or is malformed.
  [[nodiscard]] Disposition decide(std::string_view requestPath) const;

  [[nodiscard]] const EffectiveConfig& config() const noexcept { return *_config; }

 private:
  [[nodiscard]] Disposition fallback() const;

  std::shared_ptr<const EffectiveConfig> _config;
  std::filesystem::path _root;
};

}  // namespace serve
