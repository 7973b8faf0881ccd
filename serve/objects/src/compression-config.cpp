#include "serve/compression-config.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <string_view>

#include "serve/encoding.hpp"
#include "serve/mime-mappings.hpp"
#include "serve/string-helpers.hpp"

#ifdef SERVE_ENABLE_ZSTD
#include <zstd.h>

#include "serve/zstd-encoder.hpp"
#endif

namespace serve {

void CompressionConfig::validate() const {
  if (minBytes > maxBytes) {
    throw std::invalid_argument(std::format("Invalid compression size range [{}, {}]", minBytes, maxBytes));
  }
  if (zlib.level != Zlib::kDefaultLevel && (zlib.level < Zlib::kMinLevel || zlib.level > Zlib::kMaxLevel)) {
    throw std::invalid_argument(std::format("Invalid ZLIB compression level {}", zlib.level));
  }
  auto it = std::ranges::find_if(preferredFormats, [](Encoding enc) { return enc == Encoding::none; });
  if (it != preferredFormats.end()) {
    throw std::invalid_argument("identity cannot be listed in preferredFormats");
  }
  it = std::ranges::find_if_not(preferredFormats, [](Encoding enc) { return IsEncodingEnabled(enc); });
  if (it != preferredFormats.end()) {
    throw std::invalid_argument(std::format("Unsupported encoding {} in preferredFormats", GetEncodingStr(*it)));
  }

#ifdef SERVE_ENABLE_ZSTD
  if (zstd.compressionLevel < ZSTD_minCLevel() || zstd.compressionLevel > ZSTD_maxCLevel()) {
    throw std::invalid_argument(std::format("Invalid ZSTD compression level {}", zstd.compressionLevel));
  }
  details::ZstdContextRAII testConstruction(zstd.compressionLevel, zstd.windowLog);
#endif

  if (brotli.quality < Brotli::kMinQuality || brotli.quality > Brotli::kMaxQuality) {
    throw std::invalid_argument(std::format("Invalid Brotli quality {}", brotli.quality));
  }
  if (brotli.window < Brotli::kMinWindow || brotli.window > Brotli::kMaxWindow) {
    throw std::invalid_argument(std::format("Invalid Brotli window {}", brotli.window));
  }
}

namespace {

// Strips parameters such as '; charset=utf-8'.
constexpr std::string_view MediaType(std::string_view contentType) noexcept {
  return TrimOws(contentType.substr(0, contentType.find(';')));
}

}  // namespace

bool CompressionConfig::IsCompressibleContentType(std::string_view contentType) noexcept {
  contentType = MediaType(contentType);
  if (StartsWithCaseInsensitive(contentType, "text/")) {
    return true;
  }
  return std::ranges::any_of(kMIMEMappings, [contentType](const MIMEMapping& mapping) {
    return mapping.compressible && CaseInsensitiveEqual(MediaType(mapping.mimeType), contentType);
  });
}

}  // namespace serve
