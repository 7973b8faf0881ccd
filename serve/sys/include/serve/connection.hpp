#pragma once

#include "serve/base-fd.hpp"
#include "serve/socket.hpp"

namespace serve {

// Accepted client connection (non-blocking, close-on-exec).
class Connection {
 public:
  // Accept a pending connection on the given listening socket.
  // If no connection is pending (or accept failed, logged), the Connection is empty.
  explicit Connection(const Socket& socket);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  bool operator==(const Connection&) const noexcept = default;

 private:
  BaseFd _baseFd;
};

}  // namespace serve
