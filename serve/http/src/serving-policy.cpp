#include "serve/serving-policy.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "serve/effective-config.hpp"
#include "serve/url-decode.hpp"

namespace serve {

ServingPolicy::ServingPolicy(std::shared_ptr<const EffectiveConfig> config) : _config(std::move(config)) {
  std::error_code ec;
  _root = std::filesystem::weakly_canonical(_config->path, ec);
  if (ec) {
    _root = std::filesystem::absolute(_config->path);
  }
}

Disposition ServingPolicy::decide(std::string_view requestPath) const {
  std::string decoded(requestPath);
  const char* decodedEnd = url::DecodeInPlace(decoded.data(), decoded.data() + decoded.size());
  if (decodedEnd == nullptr) {
    throw ServingError(ServingError::Kind::MalformedPath, "Invalid percent-encoding in request path");
  }
  decoded.resize(static_cast<std::size_t>(decodedEnd - decoded.data()));

  if (decoded.contains('\0') || decoded.contains('\\')) {
    throw ServingError(ServingError::Kind::OutOfRoot, "Forbidden character in request path");
  }

  const bool requestedTrailingSlash = decoded.empty() || decoded.ends_with('/');

  std::filesystem::path relative;
  std::string_view remaining = decoded;
  while (!remaining.empty()) {
    const auto slashPos = remaining.find('/');
    const auto segment = remaining.substr(0, slashPos);
    if (segment == "..") {
      throw ServingError(ServingError::Kind::OutOfRoot, "Request path escapes the served directory");
    }
    if (!segment.empty() && segment != ".") {
      relative /= std::filesystem::path(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(slashPos + 1);
  }

  // Symbolic links under the root are followed, even when they lead outside of it.
  std::filesystem::path resolved = _root / relative;
  std::error_code ec;
  const auto status = std::filesystem::status(resolved, ec);
  if (ec) {
    return fallback();
  }
  if (std::filesystem::is_regular_file(status)) {
    if (requestedTrailingSlash) {
      // A file cannot be addressed as a directory.
      return fallback();
    }
    return disposition::Serve{std::move(resolved)};
  }
  if (std::filesystem::is_directory(status)) {
    std::filesystem::path indexPath = resolved / kIndexFile;
    if (std::filesystem::is_regular_file(indexPath, ec)) {
      if (requestedTrailingSlash) {
        return disposition::Serve{std::move(indexPath)};
      }
      std::string location(requestPath);
      location.push_back('/');
      return disposition::RedirectToDirectory{std::move(location)};
    }
  }
  return fallback();
}

Disposition ServingPolicy::fallback() const {
  if (!_config->notFound) {
    return disposition::NotFoundEmpty{};
  }
  if (_config->okOverride) {
    return disposition::OkOverride{*_config->notFound};
  }
  return disposition::NotFoundWithBody{*_config->notFound};
}

}  // namespace serve
