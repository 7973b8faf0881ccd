#include "serve/version.hpp"

#include <brotli/encode.h>
#include <openssl/opensslv.h>
#include <spdlog/version.h>
#include <zlib.h>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

#ifdef SERVE_ENABLE_ZSTD
#include <zstd.h>
#endif

namespace serve {

namespace {

std::string BuildFullVersionString() {
  const uint32_t brotliVersion = BrotliEncoderVersion();
  std::string compression = std::format("zlib {}, brotli {}.{}.{}", ZLIB_VERSION, brotliVersion >> 24,
                                        (brotliVersion >> 12) & 0xFFFU, brotliVersion & 0xFFFU);
#ifdef SERVE_ENABLE_ZSTD
  compression.append(std::format(", zstd {}", ZSTD_versionString()));
#endif
  return std::format("serve {}\n  tls: {}\n  logging: spdlog {}.{}.{}\n  compression: {}", version(),
                     OPENSSL_VERSION_TEXT, SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH, compression);
}

}  // namespace

std::string_view fullVersionString() {
  static const std::string kFullVersion = BuildFullVersionString();
  return kFullVersion;
}

}  // namespace serve
