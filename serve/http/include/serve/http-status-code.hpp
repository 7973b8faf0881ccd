#pragma once

#include <cstdint>
#include <string_view>

namespace serve::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodePartialContent = 206;

inline constexpr StatusCode StatusCodeNotModified = 304;
inline constexpr StatusCode StatusCodeTemporaryRedirect = 307;
inline constexpr StatusCode StatusCodePermanentRedirect = 308;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeNotAcceptable = 406;
inline constexpr StatusCode StatusCodeRequestTimeout = 408;
inline constexpr StatusCode StatusCodePreconditionFailed = 412;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeURITooLong = 414;
inline constexpr StatusCode StatusCodeRangeNotSatisfiable = 416;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;
inline constexpr StatusCode StatusCodeHTTPVersionNotSupported = 505;

// Standard reason phrase of the given status code, empty for unknown codes.
std::string_view ReasonPhrase(StatusCode statusCode) noexcept;

}  // namespace serve::http
