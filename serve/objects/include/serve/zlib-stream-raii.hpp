#pragma once

#include <zlib.h>

#include <cstdint>

namespace serve {

// Owns a z_stream initialized for compression.
struct ZStreamRAII {
  enum class Variant : int8_t { gzip, deflate };

  // Throws std::runtime_error on failure.
  ZStreamRAII(Variant variant, int8_t level);

  // z_stream is not moveable or copyable
  ZStreamRAII(const ZStreamRAII&) = delete;
  ZStreamRAII(ZStreamRAII&&) noexcept = delete;
  ZStreamRAII& operator=(const ZStreamRAII&) = delete;
  ZStreamRAII& operator=(ZStreamRAII&&) noexcept = delete;

  ~ZStreamRAII();

  z_stream stream{};
};

}  // namespace serve
