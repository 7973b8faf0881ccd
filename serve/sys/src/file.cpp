#include "serve/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>

#include "serve/errno-throw.hpp"
#include "serve/log.hpp"
#include "serve/timedef.hpp"

namespace serve {

File::File(const std::string& path) : _fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
  if (!_fd) {
    log::debug("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    log::error("Unable to stat file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    _fd.close();
    return;
  }
  _size = static_cast<std::size_t>(st.st_size);
  _lastModified = SysTimePoint{std::chrono::duration_cast<SysDuration>(std::chrono::seconds{st.st_mtim.tv_sec} +
                                                                       std::chrono::nanoseconds{st.st_mtim.tv_nsec})};
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead >= 0) {
      return static_cast<std::size_t>(nbRead);
    }
    if (errno != EINTR) {
      log::error("pread failed for fd # {} at offset {}: {}", _fd.fd(), offset, std::strerror(errno));
      return kError;
    }
  }
}

std::string File::loadAllContent() const {
  std::string content(_size, '\0');
  std::size_t pos = 0;
  while (pos < content.size()) {
    const std::size_t nbRead = readAt(std::span<char>(content.data() + pos, content.size() - pos), pos);
    if (nbRead == kError) {
      throw_errno("Unable to read file fd # {}", _fd.fd());
    }
    if (nbRead == 0) {
      // File shrank since it was opened.
      content.resize(pos);
      break;
    }
    pos += nbRead;
  }
  return content;
}

}  // namespace serve
