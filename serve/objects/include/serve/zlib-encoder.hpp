#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "serve/compression-config.hpp"
#include "serve/encoder.hpp"
#include "serve/zlib-stream-raii.hpp"

namespace serve {

// gzip or raw zlib ('deflate' content-coding) encoder.
class ZlibEncoder : public Encoder {
 public:
  ZlibEncoder(ZStreamRAII::Variant variant, const CompressionConfig& cfg) : _level(cfg.zlib.level), _variant(variant) {}

  void encodeFull(std::string_view data, std::string& out) override;

 private:
  int8_t _level;
  ZStreamRAII::Variant _variant;
};

}  // namespace serve
