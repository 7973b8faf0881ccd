#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "serve/http-method.hpp"
#include "serve/http-status-code.hpp"

namespace serve {

// Parsed request head. All views point into the connection's receive buffer and are only valid until the
// request has been answered.
class HttpRequest {
 public:
  // Returned by initTrySetHead while the head is incomplete.
  static constexpr http::StatusCode kStatusNeedMoreData = 0;

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Raw request target as received (percent-encoded, including the query string).
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Path part of the target, still percent-encoded.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Case insensitive lookup of the first header with this name. Values are OWS trimmed.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // True if the connection can be reused after this request (HTTP/1.1 default, HTTP/1.0 opt-in).
  [[nodiscard]] bool keepAlive() const noexcept;

  // Size of the full head (request line, headers and final CRLF) in the buffer given to initTrySetHead.
  [[nodiscard]] std::size_t headSpanSize() const noexcept { return _headSpanSize; }

  // Attempts to parse a request head at the beginning of 'buffer'.
  // Returns StatusCodeOK on success, kStatusNeedMoreData if the head is incomplete,
  // or the error status code to answer with (the connection should then be closed).
  // Requests announcing a body are rejected: this server only serves GET and HEAD.
  http::StatusCode initTrySetHead(std::string_view buffer, std::size_t maxHeaderBytes);

 private:
  std::vector<std::pair<std::string_view, std::string_view>> _headers;
  std::string_view _target;
  std::string_view _path;
  std::size_t _headSpanSize{};
  http::Method _method{http::Method::GET};
  uint8_t _versionMinor{1};
};

}  // namespace serve
