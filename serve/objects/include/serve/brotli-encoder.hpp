#pragma once

#include <string>
#include <string_view>

#include "serve/compression-config.hpp"
#include "serve/encoder.hpp"

namespace serve {

class BrotliEncoder final : public Encoder {
 public:
  explicit BrotliEncoder(const CompressionConfig& cfg) : _quality(cfg.brotli.quality), _window(cfg.brotli.window) {}

  void encodeFull(std::string_view data, std::string& out) override;

 private:
  int _quality;
  int _window;
};

}  // namespace serve
