#pragma once

#include <brotli/encode.h>
#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "serve/encoding.hpp"

#ifdef SERVE_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace serve {

// Response compression tuning. Whether compression is used at all is decided by the effective configuration
// ('disable_compression'), these values only shape how it is done.
struct CompressionConfig {
  void validate() const;

  // Preferred order of formats to negotiate (first supported & accepted wins). If empty, defaults
  // to enumeration order of Encoding.
  std::vector<Encoding> preferredFormats;

  // If true, adds a Vary: Accept-Encoding header to every response eligible for compression.
  bool addVaryHeader{true};

  struct Zlib {
    static constexpr int8_t kDefaultLevel = Z_DEFAULT_COMPRESSION;
    static constexpr int8_t kMinLevel = Z_BEST_SPEED;
    static constexpr int8_t kMaxLevel = Z_BEST_COMPRESSION;

    int8_t level = kDefaultLevel;
  } zlib;

  struct Zstd {
#ifdef SERVE_ENABLE_ZSTD
    int8_t compressionLevel = ZSTD_CLEVEL_DEFAULT;
#else
    int8_t compressionLevel = 0;
#endif
    int8_t windowLog = 0;
  } zstd;

  struct Brotli {
    // Files are compressed per request, maximum quality would be far too slow for multi-MiB assets.
    static constexpr int8_t kDefaultQuality = 5;
    static constexpr int8_t kDefaultWindow = BROTLI_DEFAULT_WINDOW;
    static constexpr int8_t kMinQuality = BROTLI_MIN_QUALITY;
    static constexpr int8_t kMaxQuality = BROTLI_MAX_QUALITY;
    static constexpr int8_t kMinWindow = BROTLI_MIN_WINDOW_BITS;
    static constexpr int8_t kMaxWindow = BROTLI_MAX_WINDOW_BITS;

    int8_t quality = kDefaultQuality;
    int8_t window = kDefaultWindow;
  } brotli;

  // Only bodies whose (uncompressed) size is within [minBytes, maxBytes] are considered for compression.
  // Larger files are streamed from disk as is.
  std::size_t minBytes{1024UL};
  std::size_t maxBytes{8UL * 1024UL * 1024UL};

  // Returns true if a response with this content type may be compressed (text, JSON, JavaScript, XML, SVG...).
  [[nodiscard]] static bool IsCompressibleContentType(std::string_view contentType) noexcept;
};

}  // namespace serve
