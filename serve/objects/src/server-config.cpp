#include "serve/server-config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <thread>
#include <utility>

namespace serve {

void ServerConfig::validate() const {
  compression.validate();

  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be strictly positive");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (keepAliveTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveTimeout must be non-negative");
  }
  if (readChunkBytes == 0 || fileChunkBytes == 0) {
    throw std::invalid_argument("read chunk sizes must be strictly positive");
  }
}

uint32_t ServerConfig::effectiveNbThreads() const noexcept {
  if (nbThreads != 0) {
    return nbThreads;
  }
  return std::max(1U, std::thread::hardware_concurrency());
}

}  // namespace serve
