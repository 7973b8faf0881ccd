#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <vector>

#include "serve/compression-config.hpp"
#include "serve/encoding.hpp"

namespace serve {

class EncodingSelector {
 public:
  EncodingSelector();

  explicit EncodingSelector(const CompressionConfig &compressionConfig);

  struct NegotiatedResult {
    Encoding encoding{Encoding::none};

    // True when the client explicitly disallowed identity (identity;q=0) and no other acceptable encoding was
    // present. The caller may then answer 406 Not Acceptable.
    bool reject{false};
  };

  // Parse an Accept-Encoding header per RFC 9110 section 12.5.3 and select the
  // best supported encoding among supported ones.
  // Rules implemented:
  //  - Split on commas; each token may have optional parameters separated by ';'
  //  - Extract q parameter (q=0..1, default 1.0). Invalid q -> treated as 0.
  //  - Case-insensitive exact token matching.
  //  - Ignore encodings with q=0.
  //  - Prefer highest q; tie -> server preference order.
  //  - Wildcard '*' applies its q to any supported encoding not explicitly listed.
  //  - If nothing acceptable remains, fall back to identity (Encoding::none).
  [[nodiscard]] NegotiatedResult negotiateAcceptEncoding(std::string_view acceptEncoding) const;

  [[nodiscard]] const std::vector<Encoding> &preferenceOrdered() const noexcept { return _preferenceOrdered; }

 private:
  void initDefault();

  // Final ordered list of encodings the server is willing to produce.
  std::vector<Encoding> _preferenceOrdered;
  // Position of each encoding in _preferenceOrdered, -1 if not offered.
  std::array<int8_t, kNbContentEncodings> _serverPrefIndex;
};

}  // namespace serve
