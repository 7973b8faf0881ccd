#include "serve/http-method.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace serve::http {

namespace {
constexpr std::array<std::string_view, 9> kMethodStrs = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                         "CONNECT", "OPTIONS", "TRACE", "PATCH"};
}  // namespace

std::optional<Method> MethodFromStr(std::string_view str) noexcept {
  const auto it = std::ranges::find(kMethodStrs, str);
  if (it == kMethodStrs.end()) {
    return std::nullopt;
  }
  return static_cast<Method>(it - kMethodStrs.begin());
}

std::string_view MethodToStr(Method method) noexcept { return kMethodStrs[static_cast<std::size_t>(method)]; }

}  // namespace serve::http
