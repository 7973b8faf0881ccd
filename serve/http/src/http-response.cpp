#include "serve/http-response.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "serve/file.hpp"
#include "serve/http-constants.hpp"
#include "serve/http-status-code.hpp"
#include "serve/string-helpers.hpp"
#include "serve/timedef.hpp"
#include "serve/timestring.hpp"

namespace serve {

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  const auto it =
      std::ranges::find_if(_headers, [name](const auto& header) { return CaseInsensitiveEqual(header.first, name); });
  if (it == _headers.end()) {
    _headers.emplace_back(name, value);
  } else {
    it->second = value;
  }
  return *this;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  const auto it =
      std::ranges::find_if(_headers, [name](const auto& header) { return CaseInsensitiveEqual(header.first, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) {
  _body = std::move(body);
  _filePayload.reset();
  header(http::ContentType, contentType);
  return *this;
}

HttpResponse& HttpResponse::file(File file, std::size_t offset, std::size_t length) {
  _body.clear();
  _filePayload.emplace(std::move(file), offset, length);
  return *this;
}

std::string HttpResponse::serializeHead(SysTimePoint date, bool keepAlive) const {
  const auto reason = http::ReasonPhrase(_statusCode);

  std::string head;
  head.reserve(256);
  head.append(http::HTTP11);
  head.push_back(' ');
  char buf[24];
  head.append(buf, std::to_chars(buf, buf + sizeof(buf), _statusCode).ptr);
  head.push_back(' ');
  head.append(reason);
  head.append(http::CRLF);

  head.append(http::Date);
  head.append(": ");
  head.append(TimeToStringRFC7231(date));
  head.append(http::CRLF);

  for (const auto& [name, value] : _headers) {
    head.append(name);
    head.append(": ");
    head.append(value);
    head.append(http::CRLF);
  }

  if (_statusCode != http::StatusCodeNotModified) {
    head.append(http::ContentLength);
    head.append(": ");
    head.append(buf, std::to_chars(buf, buf + sizeof(buf), bodyLength()).ptr);
    head.append(http::CRLF);
  }

  head.append(http::Connection);
  head.append(": ");
  head.append(keepAlive ? http::keepalive : http::close);
  head.append(http::DoubleCRLF);
  return head;
}

}  // namespace serve
