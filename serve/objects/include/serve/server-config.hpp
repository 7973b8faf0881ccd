#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "serve/compression-config.hpp"

namespace serve {

// Tuning of the listeners, not exposed on the command line.
struct ServerConfig {
  // Throws std::invalid_argument if a value is out of range.
  void validate() const;

  // Number of event loop threads per listener, each with its own SO_REUSEPORT socket.
  // 0 means std::thread::hardware_concurrency() (at least 1).
  uint32_t nbThreads{0};

  // Upper bound of each epoll_wait call. Stop requests and idle timeouts are checked at this period.
  std::chrono::milliseconds pollInterval{500};

  // Maximum size of the request head (request line + headers + CRLFCRLF). 431 beyond.
  std::size_t maxHeaderBytes{16UL * 1024UL};

  // Idle keep-alive connections are closed after this duration without activity.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::seconds{30}};

  // Size of each socket read.
  std::size_t readChunkBytes{4096};

  // Size of each pread when streaming a file body.
  std::size_t fileChunkBytes{64UL * 1024UL};

  CompressionConfig compression;

  // Resolves nbThreads == 0.
  [[nodiscard]] uint32_t effectiveNbThreads() const noexcept;
};

}  // namespace serve
