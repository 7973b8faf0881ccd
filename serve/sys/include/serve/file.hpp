#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>

#include "serve/base-fd.hpp"
#include "serve/timedef.hpp"

namespace serve {

// Read-only file opened through an owned descriptor.
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path (read only). On failure (logged at debug level), operator bool() returns false.
  explicit File(const std::string& path);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // File size in bytes and last modification time, captured when opening.
  [[nodiscard]] std::size_t size() const noexcept { return _size; }
  [[nodiscard]] SysTimePoint lastModified() const noexcept { return _lastModified; }

  // Read up to dst.size() bytes starting at the given absolute offset, without moving the file offset.
  // Returns the number of bytes read (0 on EOF), or kError on error.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

  // Load the whole file content in memory.
  // Throws std::system_error on read error.
  [[nodiscard]] std::string loadAllContent() const;

 private:
  BaseFd _fd;
  std::size_t _size{kError};
  SysTimePoint _lastModified;
};

}  // namespace serve
