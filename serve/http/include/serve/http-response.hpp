#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "serve/file.hpp"
#include "serve/http-constants.hpp"
#include "serve/http-status-code.hpp"
#include "serve/timedef.hpp"

namespace serve {

// Part of a file to be streamed as response body.
struct FilePayload {
  File file;
  std::size_t offset{};
  std::size_t length{};
};

// Response under construction. The body is either held in memory or streamed from a file.
class HttpResponse {
 public:
  explicit HttpResponse(http::StatusCode statusCode = http::StatusCodeOK) noexcept : _statusCode(statusCode) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  HttpResponse& status(http::StatusCode statusCode) noexcept {
    _statusCode = statusCode;
    return *this;
  }

  // Sets a header, replacing any previous value of a header with the same (case insensitive) name.
  HttpResponse& header(std::string_view name, std::string_view value);

  // Appends a header without checking for duplicates.
  HttpResponse& addHeader(std::string_view name, std::string_view value) {
    _headers.emplace_back(name, value);
    return *this;
  }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& headers() const noexcept { return _headers; }

  // Sets an in-memory body with its content type. Drops any file payload.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] std::string_view bodyView() const noexcept { return _body; }

  // Replaces the in-memory body, keeping headers untouched.
  void setBodyOnly(std::string body) noexcept {
    _body = std::move(body);
    _filePayload.reset();
  }

  // Streams [offset, offset + length) of 'file' as body.
  HttpResponse& file(File file, std::size_t offset, std::size_t length);

  // Streams the whole file.
  HttpResponse& file(File file) {
    const auto size = file.size();
    return this->file(std::move(file), 0, size);
  }

  [[nodiscard]] bool hasFile() const noexcept { return _filePayload.has_value(); }

  [[nodiscard]] FilePayload* filePayload() noexcept { return _filePayload ? &*_filePayload : nullptr; }
  [[nodiscard]] const FilePayload* filePayload() const noexcept { return _filePayload ? &*_filePayload : nullptr; }

  std::optional<FilePayload> releaseFile() noexcept { return std::exchange(_filePayload, std::nullopt); }

  std::string releaseBody() noexcept { return std::exchange(_body, std::string{}); }

  // Announced body size: the in-memory body size or the file payload length.
  [[nodiscard]] std::size_t bodyLength() const noexcept { return _filePayload ? _filePayload->length : _body.size(); }

  // Status line, headers, Date, Content-Length (except for 304) and Connection, followed by the empty line.
  [[nodiscard]] std::string serializeHead(SysTimePoint date, bool keepAlive) const;

 private:
  std::vector<std::pair<std::string, std::string>> _headers;
  std::string _body;
  std::optional<FilePayload> _filePayload;
  http::StatusCode _statusCode;
};

}  // namespace serve
