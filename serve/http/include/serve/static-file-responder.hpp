#pragma once

#include <filesystem>

#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/http-status-code.hpp"
#include "serve/serving-policy.hpp"

namespace serve {

// Builds the response of a request according to the disposition chosen by the ServingPolicy:
// file bodies with validators (ETag, Last-Modified), conditional requests, single byte ranges and fallbacks.
// Bodies are not compressed here, see ResponseCompressor.
class StaticFileResponder {
 public:
  explicit StaticFileResponder(const ServingPolicy& policy) noexcept : _policy(policy) {}

  // Never throws for client errors: traversal attempts become 403, malformed paths 400, unsupported methods 405.
  [[nodiscard]] HttpResponse respond(const HttpRequest& request) const;

 private:
  [[nodiscard]] HttpResponse serveFile(const HttpRequest& request, const std::filesystem::path& filePath) const;

  [[nodiscard]] static HttpResponse FallbackBody(http::StatusCode statusCode, const std::filesystem::path& filePath);

  const ServingPolicy& _policy;
};

}  // namespace serve
