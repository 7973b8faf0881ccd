#include "serve/response-compressor.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "serve/accept-encoding-negotiation.hpp"
#include "serve/brotli-encoder.hpp"
#include "serve/compression-config.hpp"
#include "serve/encoder.hpp"
#include "serve/encoding.hpp"
#include "serve/http-constants.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/http-status-code.hpp"
#include "serve/log.hpp"
#include "serve/zlib-encoder.hpp"
#include "serve/zlib-stream-raii.hpp"

#ifdef SERVE_ENABLE_ZSTD
#include "serve/zstd-encoder.hpp"
#endif

namespace serve {

ResponseCompressor::ResponseCompressor(CompressionConfig config) : _config(std::move(config)), _selector(_config) {
  _config.validate();
}

bool ResponseCompressor::isEligible(const HttpRequest& request, const HttpResponse& response) const {
  if (response.status() != http::StatusCodeOK && response.status() != http::StatusCodeNotFound) {
    return false;
  }
  if (request.headerValue(http::Range) || response.headerValue(http::ContentEncoding)) {
    return false;
  }
  const auto bodyLength = response.bodyLength();
  if (bodyLength < _config.minBytes || bodyLength > _config.maxBytes) {
    return false;
  }
  const auto contentType = response.headerValue(http::ContentType);
  return contentType && CompressionConfig::IsCompressibleContentType(*contentType);
}

void ResponseCompressor::apply(const HttpRequest& request, HttpResponse& response) {
  if (!isEligible(request, response)) {
    return;
  }
  if (_config.addVaryHeader) {
    response.addHeader(http::Vary, http::AcceptEncoding);
  }
  const auto negotiated = _selector.negotiateAcceptEncoding(request.headerValueOrEmpty(http::AcceptEncoding));
  if (negotiated.reject) {
    response = HttpResponse(http::StatusCodeNotAcceptable);
    response.body("No acceptable content-coding available");
    return;
  }
  if (negotiated.encoding == Encoding::none) {
    return;
  }

  std::string plain;
  if (const auto* pFilePayload = response.filePayload()) {
    plain = pFilePayload->file.loadAllContent();
  } else {
    plain = response.releaseBody();
  }

  std::string compressed;
  encoder(negotiated.encoding).encodeFull(plain, compressed);
  if (compressed.size() >= plain.size()) {
    log::trace("{} does not reduce body size ({} >= {}), sending identity", GetEncodingStr(negotiated.encoding),
               compressed.size(), plain.size());
    response.setBodyOnly(std::move(plain));
    return;
  }
  response.setBodyOnly(std::move(compressed));
  response.addHeader(http::ContentEncoding, GetEncodingStr(negotiated.encoding));
}

Encoder& ResponseCompressor::encoder(Encoding encoding) {
  auto& encoderPtr = _encoders[static_cast<std::size_t>(encoding)];
  if (!encoderPtr) {
    switch (encoding) {
#ifdef SERVE_ENABLE_ZSTD
      case Encoding::zstd:
        encoderPtr = std::make_unique<ZstdEncoder>(_config);
        break;
#endif
      case Encoding::br:
        encoderPtr = std::make_unique<BrotliEncoder>(_config);
        break;
      case Encoding::gzip:
        encoderPtr = std::make_unique<ZlibEncoder>(ZStreamRAII::Variant::gzip, _config);
        break;
      case Encoding::deflate:
        encoderPtr = std::make_unique<ZlibEncoder>(ZStreamRAII::Variant::deflate, _config);
        break;
      default:
        throw std::invalid_argument("No encoder for this encoding");
    }
  }
  return *encoderPtr;
}

}  // namespace serve
