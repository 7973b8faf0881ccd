#pragma once

#include <zstd.h>

#include <memory>
#include <string>
#include <string_view>

#include "serve/compression-config.hpp"
#include "serve/encoder.hpp"

namespace serve {

namespace details {

struct ZstdContextRAII {
  // Throws std::invalid_argument if the parameters are rejected.
  ZstdContextRAII(int level, int windowLog);

  std::unique_ptr<ZSTD_CCtx, void (*)(ZSTD_CCtx*)> ctx;
  int level{0};
};

}  // namespace details

class ZstdEncoder : public Encoder {
 public:
  explicit ZstdEncoder(const CompressionConfig& cfg) : _zs(cfg.zstd.compressionLevel, cfg.zstd.windowLog) {}

  void encodeFull(std::string_view data, std::string& out) override;

 private:
  details::ZstdContextRAII _zs;
};

}  // namespace serve
