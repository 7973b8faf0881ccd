#include "serve/brotli-encoder.hpp"

#include <brotli/encode.h>
#include <brotli/types.h>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace serve {

void BrotliEncoder::encodeFull(std::string_view data, std::string& out) {
  const auto oldSize = out.size();
  const std::size_t maxCompressedSize = BrotliEncoderMaxCompressedSize(data.size());
  if (maxCompressedSize == 0) [[unlikely]] {
    throw std::runtime_error("Input too large for Brotli");
  }

  BROTLI_BOOL ok = BROTLI_FALSE;
  out.resize_and_overwrite(oldSize + maxCompressedSize, [&](char* buf, std::size_t) {
    auto* dst = reinterpret_cast<uint8_t*>(buf + oldSize);
    std::size_t outSize = maxCompressedSize;

    ok = BrotliEncoderCompress(_quality, _window, BROTLI_MODE_GENERIC, data.size(),
                               reinterpret_cast<const uint8_t*>(data.data()), &outSize, dst);
    return ok == BROTLI_TRUE ? oldSize + outSize : oldSize;
  });
  if (ok == BROTLI_FALSE) {
    throw std::runtime_error("BrotliEncoderCompress failed");
  }
}

}  // namespace serve
