#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace serve::http {

enum class Method : int8_t { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH };

// Case sensitive, as per RFC 9110.
std::optional<Method> MethodFromStr(std::string_view str) noexcept;

std::string_view MethodToStr(Method method) noexcept;

}  // namespace serve::http
