#pragma once

namespace serve {

#ifdef SERVE_ENABLE_ZSTD
constexpr bool zstdEnabled() { return true; }
#else
constexpr bool zstdEnabled() { return false; }
#endif

}  // namespace serve
