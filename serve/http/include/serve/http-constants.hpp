#pragma once

#include <string_view>

namespace serve::http {

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view HTTP11 = "HTTP/1.1";

// Header names
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view AcceptRanges = "Accept-Ranges";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentRange = "Content-Range";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view ETag = "ETag";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view IfModifiedSince = "If-Modified-Since";
inline constexpr std::string_view IfNoneMatch = "If-None-Match";
inline constexpr std::string_view IfRange = "If-Range";
inline constexpr std::string_view LastModified = "Last-Modified";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Range = "Range";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view Vary = "Vary";

// Header values
inline constexpr std::string_view close = "close";
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view bytes = "bytes";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";

}  // namespace serve::http
