#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "serve/compression-config.hpp"
#include "serve/effective-config.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/response-compressor.hpp"
#include "serve/serving-policy.hpp"
#include "serve/static-file-responder.hpp"

namespace serve {

// Produces the response of a parsed request. Each event loop thread owns its own instance.
// Exceptions escaping handle() are answered with 500 by the server.
class RequestHandler {
 public:
  virtual ~RequestHandler() = default;

  virtual HttpResponse handle(const HttpRequest& request) = 0;
};

using RequestHandlerFactory = std::function<std::unique_ptr<RequestHandler>()>;

// Serves the configured directory, with fallbacks and optional compression.
class StaticFilesHandler final : public RequestHandler {
 public:
  StaticFilesHandler(std::shared_ptr<const EffectiveConfig> config, const CompressionConfig& compressionConfig);

  StaticFilesHandler(const StaticFilesHandler&) = delete;
  StaticFilesHandler& operator=(const StaticFilesHandler&) = delete;
  StaticFilesHandler(StaticFilesHandler&&) = delete;
  StaticFilesHandler& operator=(StaticFilesHandler&&) = delete;

  ~StaticFilesHandler() override = default;

  HttpResponse handle(const HttpRequest& request) override;

 private:
  ServingPolicy _policy;
  StaticFileResponder _responder;
  std::optional<ResponseCompressor> _compressor;
};

// Redirects every request to its HTTPS equivalent.
class HttpsRedirectHandler final : public RequestHandler {
 public:
  HttpResponse handle(const HttpRequest& request) override;
};

}  // namespace serve
