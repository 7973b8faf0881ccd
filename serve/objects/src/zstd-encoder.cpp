#include "serve/zstd-encoder.hpp"

#include <zstd.h>

#include <cstddef>
#include <format>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

namespace serve {

namespace details {

namespace {
void ZSTD_freeWrapper(ZSTD_CCtx* pCtx) { (void)ZSTD_freeCCtx(pCtx); }
}  // namespace

ZstdContextRAII::ZstdContextRAII(int level, int windowLog) : ctx(ZSTD_createCCtx(), &ZSTD_freeWrapper), level(level) {
  if (!ctx) [[unlikely]] {
    throw std::bad_alloc();
  }

  auto ret = ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_compressionLevel, level);
  if (ZSTD_isError(ret) != 0U) {
    throw std::invalid_argument(std::format("Invalid zstd compression level {}: {}", level, ZSTD_getErrorName(ret)));
  }

  if (windowLog > 0) {
    ret = ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_windowLog, windowLog);
    if (ZSTD_isError(ret) != 0U) {
      throw std::invalid_argument(std::format("Invalid zstd window log {}: {}", windowLog, ZSTD_getErrorName(ret)));
    }
  }
}
}  // namespace details

void ZstdEncoder::encodeFull(std::string_view data, std::string& out) {
  const auto oldSize = out.size();
  const auto maxCompressedSize = ZSTD_compressBound(data.size());

  std::size_t written = 0;
  out.resize_and_overwrite(oldSize + maxCompressedSize, [&](char* buf, std::size_t) {
    written = ZSTD_compress2(_zs.ctx.get(), buf + oldSize, maxCompressedSize, data.data(), data.size());
    return ZSTD_isError(written) != 0U ? oldSize : oldSize + written;
  });
  if (ZSTD_isError(written) != 0U) [[unlikely]] {
    throw std::runtime_error(std::format("zstd compress2 error: {}", ZSTD_getErrorName(written)));
  }
}

}  // namespace serve
