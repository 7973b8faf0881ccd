#pragma once

#include <array>
#include <memory>

#include "serve/accept-encoding-negotiation.hpp"
#include "serve/compression-config.hpp"
#include "serve/encoder.hpp"
#include "serve/encoding.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"

namespace serve {

// Compresses eligible response bodies according to the client's Accept-Encoding.
// Owns its encoders: one instance per event loop thread.
class ResponseCompressor {
 public:
  explicit ResponseCompressor(CompressionConfig config);

  // Returns true if 'response' may be compressed, regardless of what the client accepts.
  [[nodiscard]] bool isEligible(const HttpRequest& request, const HttpResponse& response) const;

  // Compresses the body of 'response' in place when eligible, accepted by the client and worth it.
  // An eligible response is replaced by a 406 when the client refuses identity and every supported encoding.
  // File payloads are loaded in memory first. Throws std::system_error if the file cannot be read.
  void apply(const HttpRequest& request, HttpResponse& response);

 private:
  Encoder& encoder(Encoding encoding);

  CompressionConfig _config;
  EncodingSelector _selector;
  std::array<std::unique_ptr<Encoder>, kNbContentEncodings> _encoders;
};

}  // namespace serve
