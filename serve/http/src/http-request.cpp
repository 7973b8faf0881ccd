#include "serve/http-request.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

#include "serve/http-constants.hpp"
#include "serve/http-method.hpp"
#include "serve/http-status-code.hpp"
#include "serve/string-helpers.hpp"

namespace serve {

namespace {

constexpr bool IsTokenChar(char ch) {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").contains(ch);
}

// CTL characters (RFC 9110 5.5), bare CR and LF included. HTAB is allowed in field values only.
constexpr bool IsControlChar(char ch) { return static_cast<unsigned char>(ch) < 0x20 || ch == 0x7F; }

constexpr bool IsFieldValueChar(char ch) { return ch == '\t' || !IsControlChar(ch); }

}  // namespace

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_headers, [name](const auto& header) { return CaseInsensitiveEqual(header.first, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool HttpRequest::keepAlive() const noexcept {
  const auto connection = headerValueOrEmpty(http::Connection);
  if (_versionMinor == 0) {
    return HeaderListContains(connection, http::keepalive);
  }
  return !HeaderListContains(connection, http::close);
}

http::StatusCode HttpRequest::initTrySetHead(std::string_view buffer, std::size_t maxHeaderBytes) {
  const auto headEnd = buffer.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    // Incomplete head: keep reading until maxHeaderBytes.
    return buffer.size() > maxHeaderBytes ? http::StatusCodeRequestHeaderFieldsTooLarge : kStatusNeedMoreData;
  }
  _headSpanSize = headEnd + http::DoubleCRLF.size();
  if (_headSpanSize > maxHeaderBytes) {
    return http::StatusCodeRequestHeaderFieldsTooLarge;
  }

  std::string_view head = buffer.substr(0, headEnd + http::CRLF.size());

  // Request line: METHOD SP request-target SP HTTP-version
  const auto lineEnd = head.find(http::CRLF);
  const std::string_view requestLine = head.substr(0, lineEnd);
  head.remove_prefix(lineEnd + http::CRLF.size());

  const auto firstSep = requestLine.find(' ');
  const auto lastSep = requestLine.rfind(' ');
  if (firstSep == std::string_view::npos || firstSep == lastSep) {
    return http::StatusCodeBadRequest;
  }

  const std::string_view methodStr = requestLine.substr(0, firstSep);
  if (methodStr.empty() || !std::ranges::all_of(methodStr, IsTokenChar)) {
    return http::StatusCodeBadRequest;
  }
  const auto optMethod = http::MethodFromStr(methodStr);
  if (!optMethod) {
    return http::StatusCodeNotImplemented;
  }
  _method = *optMethod;

  _target = requestLine.substr(firstSep + 1, lastSep - firstSep - 1);
  if (_target.empty() || _target.front() != '/' || _target.contains(' ') ||
      std::ranges::any_of(_target, IsControlChar)) {
    return http::StatusCodeBadRequest;
  }
  _path = _target.substr(0, _target.find('?'));

  const std::string_view version = requestLine.substr(lastSep + 1);
  if (version.size() != http::HTTP11.size() || !version.starts_with("HTTP/") || version[6] != '.') {
    return http::StatusCodeBadRequest;
  }
  if (version[5] != '1' || (version[7] != '0' && version[7] != '1')) {
    return http::StatusCodeHTTPVersionNotSupported;
  }
  _versionMinor = static_cast<uint8_t>(version[7] - '0');

  // Headers
  _headers.clear();
  while (!head.empty()) {
    const auto eol = head.find(http::CRLF);
    const std::string_view line = head.substr(0, eol);
    head.remove_prefix(eol + http::CRLF.size());

    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
      return http::StatusCodeBadRequest;
    }
    const std::string_view name = line.substr(0, colonPos);
    if (name.empty() || !std::ranges::all_of(name, IsTokenChar)) {
      return http::StatusCodeBadRequest;
    }
    const std::string_view value = line.substr(colonPos + 1);
    if (!std::ranges::all_of(value, IsFieldValueChar)) {
      return http::StatusCodeBadRequest;
    }
    _headers.emplace_back(name, TrimOws(value));
  }

  // No request body is ever accepted.
  if (headerValue(http::TransferEncoding)) {
    return http::StatusCodePayloadTooLarge;
  }
  if (const auto contentLength = headerValue(http::ContentLength)) {
    std::size_t len{};
    const auto [ptr, ec] = std::from_chars(contentLength->data(), contentLength->data() + contentLength->size(), len);
    if (ec != std::errc{} || ptr != contentLength->data() + contentLength->size()) {
      return http::StatusCodeBadRequest;
    }
    if (len != 0) {
      return http::StatusCodePayloadTooLarge;
    }
  }

  return http::StatusCodeOK;
}

}  // namespace serve
