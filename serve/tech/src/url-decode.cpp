#include "serve/url-decode.hpp"

namespace serve::url {

namespace {

constexpr int FromHexDigit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

char* DecodeInPlace(char* first, const char* last) {
  char* out = first;
  for (; first < last; ++first) {
    if (*first != '%') {
      *out++ = *first;
      continue;
    }
    if (last - first < 3) {
      return nullptr;
    }
    const int hi = FromHexDigit(first[1]);
    const int lo = FromHexDigit(first[2]);
    if (hi < 0 || lo < 0) {
      return nullptr;
    }
    *out++ = static_cast<char>((hi << 4) | lo);
    first += 2;
  }
  return out;
}

}  // namespace serve::url
