#pragma once

#include <string_view>

namespace serve {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
  // Whether responses of this type benefit from content-encoding (text-like formats).
  bool compressible;
};

inline constexpr std::string_view kDefaultMIMEType = "application/octet-stream";

// Sorted by extension (checked at compile time).
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"7z", "application/x-7z-compressed", false},
    {"aac", "audio/aac", false},
    {"apng", "image/apng", false},
    {"avif", "image/avif", false},
    {"bmp", "image/bmp", true},
    {"css", "text/css; charset=utf-8", true},
    {"csv", "text/csv; charset=utf-8", true},
    {"eot", "application/vnd.ms-fontobject", true},
    {"flac", "audio/flac", false},
    {"gif", "image/gif", false},
    {"gz", "application/gzip", false},
    {"htm", "text/html; charset=utf-8", true},
    {"html", "text/html; charset=utf-8", true},
    {"ico", "image/x-icon", true},
    {"jpeg", "image/jpeg", false},
    {"jpg", "image/jpeg", false},
    {"js", "text/javascript; charset=utf-8", true},
    {"json", "application/json", true},
    {"jsonld", "application/ld+json", true},
    {"m4a", "audio/mp4", false},
    {"manifest", "application/manifest+json", true},
    {"map", "application/json", true},
    {"md", "text/markdown; charset=utf-8", true},
    {"mjs", "text/javascript; charset=utf-8", true},
    {"mov", "video/quicktime", false},
    {"mp3", "audio/mpeg", false},
    {"mp4", "video/mp4", false},
    {"oga", "audio/ogg", false},
    {"ogg", "audio/ogg", false},
    {"ogv", "video/ogg", false},
    {"otf", "font/otf", true},
    {"pdf", "application/pdf", false},
    {"png", "image/png", false},
    {"rss", "application/rss+xml", true},
    {"svg", "image/svg+xml", true},
    {"tar", "application/x-tar", false},
    {"tgz", "application/gzip", false},
    {"tif", "image/tiff", false},
    {"tiff", "image/tiff", false},
    {"toml", "application/toml", true},
    {"ttf", "font/ttf", true},
    {"txt", "text/plain; charset=utf-8", true},
    {"wasm", "application/wasm", true},
    {"wav", "audio/wav", true},
    {"webm", "video/webm", false},
    {"webmanifest", "application/manifest+json", true},
    {"webp", "image/webp", false},
    {"woff", "font/woff", false},
    {"woff2", "font/woff2", false},
    {"xhtml", "application/xhtml+xml", true},
    {"xml", "application/xml", true},
    {"yaml", "application/yaml", true},
    {"yml", "application/yaml", true},
    {"zip", "application/zip", false},
};

// Given a file path, returns the MIME mapping of its extension (case insensitive), or nullptr if unknown.
// Non-allocating.
const MIMEMapping* DetermineMIMEMapping(std::string_view path) noexcept;

// Given a file path, returns its MIME type, or kDefaultMIMEType if the extension is unknown.
std::string_view DetermineMIMETypeStr(std::string_view path) noexcept;

}  // namespace serve
