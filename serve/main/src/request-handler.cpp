#include "serve/request-handler.hpp"

#include <memory>
#include <utility>

#include "serve/compression-config.hpp"
#include "serve/effective-config.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/https-redirect-responder.hpp"

namespace serve {

StaticFilesHandler::StaticFilesHandler(std::shared_ptr<const EffectiveConfig> config,
                                       const CompressionConfig& compressionConfig)
    : _policy(std::move(config)), _responder(_policy) {
  if (_policy.config().compressionEnabled) {
    _compressor.emplace(compressionConfig);
  }
}

HttpResponse StaticFilesHandler::handle(const HttpRequest& request) {
  HttpResponse response = _responder.respond(request);
  if (_compressor) {
    _compressor->apply(request, response);
  }
  return response;
}

HttpResponse HttpsRedirectHandler::handle(const HttpRequest& request) { return RedirectToHttps(request); }

}  // namespace serve
