#pragma once

#include <cstdint>

#include "serve/base-fd.hpp"
#include "serve/socket-address.hpp"

namespace serve {

// Simple RAII class wrapping a TCP listening socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a TCP socket of the given type for the given address family (AF_INET / AF_INET6).
  // Throws std::system_error on failure.
  Socket(Type type, int family);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to the given address and start listening.
  // If the address port is 0, an ephemeral port is chosen: use localAddress() to query it.
  // Throws std::system_error on failure (address in use, permission denied...).
  void bindAndListen(const SocketAddress& address, bool reusePort);

  [[nodiscard]] SocketAddress localAddress() const { return SocketAddress::LocalOf(fd()); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace serve
