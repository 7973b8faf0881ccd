#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

#include "serve/features.hpp"

namespace serve {

// Ordered from preferred to least preferred, used as default server preference.
enum class Encoding : std::uint8_t {
  zstd,
  br,
  gzip,
  deflate,
  none,  // should be last
};

inline constexpr std::underlying_type_t<Encoding> kNbContentEncodings =
    static_cast<std::underlying_type_t<Encoding>>(Encoding::none) + 1;

// Get string representation of encoding for use in HTTP headers.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  constexpr std::string_view kEncodingStrs[kNbContentEncodings] = {
      "zstd", "br", "gzip", "deflate", "identity",
  };
  if (static_cast<std::underlying_type_t<Encoding>>(enc) >= kNbContentEncodings) [[unlikely]] {
    return "unknown";
  }
  return kEncodingStrs[static_cast<std::underlying_type_t<Encoding>>(enc)];
}

// Check if encoding is enabled in this build. zlib and brotli are always linked, zstd is optional.
constexpr bool IsEncodingEnabled(Encoding enc) {
  switch (enc) {
    case Encoding::zstd:
      return zstdEnabled();
    case Encoding::br:
      [[fallthrough]];
    case Encoding::gzip:
      [[fallthrough]];
    case Encoding::deflate:
      [[fallthrough]];
    case Encoding::none:
      return true;
    default:
      return false;
  }
}

}  // namespace serve
