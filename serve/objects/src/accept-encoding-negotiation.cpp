#include "serve/accept-encoding-negotiation.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "serve/compression-config.hpp"
#include "serve/encoding.hpp"
#include "serve/string-helpers.hpp"

namespace serve {
namespace {

// Parse q-value within a token (portion including parameters); never throws.
double ParseQ(std::string_view token) {
  auto scPos = token.find(';');
  if (scPos == std::string_view::npos) {
    return 1.0;
  }
  std::string_view params = token.substr(scPos + 1);
  while (!params.empty()) {
    const auto nextSemi = params.find(';');
    std::string_view param = TrimOws(params.substr(0, nextSemi));
    if (nextSemi == std::string_view::npos) {
      params = {};
    } else {
      params.remove_prefix(nextSemi + 1);
    }
    if (param.size() >= 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
      const auto val = TrimOws(param.substr(2));
      if (val.empty()) {
        return 0.0;
      }
      double qualityValue = 0.0;
      const char *begin = val.data();
      const char *end = begin + val.size();
      const auto fcRes = std::from_chars(begin, end, qualityValue);
      if (fcRes.ec != std::errc() || fcRes.ptr != end) {
        return 0.0;  // invalid format
      }
      return std::clamp(qualityValue, 0.0, 1.0);
    }
  }
  return 1.0;
}

}  // namespace

EncodingSelector::EncodingSelector() { initDefault(); }

void EncodingSelector::initDefault() {
  _serverPrefIndex.fill(-1);
  for (std::underlying_type_t<Encoding> pos = 0; pos + 1 < kNbContentEncodings; ++pos) {
    const auto enc = static_cast<Encoding>(pos);
    if (IsEncodingEnabled(enc)) {
      _serverPrefIndex[pos] = static_cast<int8_t>(_preferenceOrdered.size());
      _preferenceOrdered.push_back(enc);
    }
  }
}

EncodingSelector::EncodingSelector(const CompressionConfig &compressionConfig) {
  if (compressionConfig.preferredFormats.empty()) {
    initDefault();
    return;
  }
  _serverPrefIndex.fill(-1);
  for (Encoding enc : compressionConfig.preferredFormats) {
    if (enc == Encoding::none || !IsEncodingEnabled(enc)) {
      continue;
    }
    const auto idx = static_cast<std::underlying_type_t<Encoding>>(enc);
    if (_serverPrefIndex[idx] == -1) {  // dedupe
      _serverPrefIndex[idx] = static_cast<int8_t>(_preferenceOrdered.size());
      _preferenceOrdered.push_back(enc);
    }
  }
  // Remaining encodings are not appended: preferredFormats defines the full server-advertised order.
}

EncodingSelector::NegotiatedResult EncodingSelector::negotiateAcceptEncoding(std::string_view acceptEncoding) const {
  NegotiatedResult ret;
  if (TrimOws(acceptEncoding).empty()) {
    return ret;
  }

  // Earliest q seen for each encoding, negative if not mentioned.
  std::array<double, kNbContentEncodings> explicitQ;
  explicitQ.fill(-1.0);
  bool sawWildcard = false;
  double wildcardQ = 0.0;

  while (!acceptEncoding.empty()) {
    const auto commaPos = acceptEncoding.find(',');
    const std::string_view raw = TrimOws(acceptEncoding.substr(0, commaPos));
    acceptEncoding = commaPos == std::string_view::npos ? std::string_view{} : acceptEncoding.substr(commaPos + 1);
    if (raw.empty()) {
      continue;
    }
    const std::string_view name = TrimOws(raw.substr(0, raw.find(';')));
    const double quality = ParseQ(raw);
    if (name == "*") {
      sawWildcard = true;
      wildcardQ = quality;
      continue;
    }
    for (std::underlying_type_t<Encoding> pos = 0; pos < kNbContentEncodings; ++pos) {
      if (explicitQ[pos] < 0.0 && CaseInsensitiveEqual(name, GetEncodingStr(static_cast<Encoding>(pos)))) {
        explicitQ[pos] = quality;
        break;
      }
    }
  }

  double bestQ = 0.0;
  int bestServerPreferenceIndex = std::numeric_limits<int>::max();
  for (Encoding enc : _preferenceOrdered) {
    const auto idx = static_cast<std::underlying_type_t<Encoding>>(enc);
    const double quality = explicitQ[idx] >= 0.0 ? explicitQ[idx] : (sawWildcard ? wildcardQ : 0.0);
    if (quality <= 0.0) {
      continue;  // q=0 means "not acceptable"
    }
    if (quality > bestQ || (quality == bestQ && _serverPrefIndex[idx] < bestServerPreferenceIndex)) {
      bestQ = quality;
      bestServerPreferenceIndex = _serverPrefIndex[idx];
      ret.encoding = enc;
    }
  }

  if (ret.encoding == Encoding::none) {
    // identity is acceptable unless forbidden explicitly, or through '*;q=0' without identity being listed.
    const double identityQ = explicitQ[static_cast<std::underlying_type_t<Encoding>>(Encoding::none)];
    ret.reject = identityQ == 0.0 || (identityQ < 0.0 && sawWildcard && wildcardQ <= 0.0);
  }
  return ret;
}

}  // namespace serve
