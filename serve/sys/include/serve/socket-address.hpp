#pragma once

#include <sys/socket.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace serve {

// IPv4 or IPv6 socket address built from a numeric literal (no name resolution).
class SocketAddress {
 public:
  // Parses an IPv4 ('127.0.0.1') or IPv6 ('::1', optionally bracketed '[::1]') literal.
  // Returns std::nullopt if 'ip' is not a valid literal.
  static std::optional<SocketAddress> Parse(std::string_view ip, uint16_t port);

  // Reads the local address bound to the given socket fd. Throws std::system_error on failure.
  static SocketAddress LocalOf(int fd);

  [[nodiscard]] const sockaddr* data() const noexcept { return reinterpret_cast<const sockaddr*>(&_storage); }

  [[nodiscard]] socklen_t size() const noexcept { return _length; }

  [[nodiscard]] int family() const noexcept { return _storage.ss_family; }

  [[nodiscard]] uint16_t port() const noexcept;

  // "127.0.0.1:3000" or "[::1]:3000"
  [[nodiscard]] std::string str() const;

 private:
  sockaddr_storage _storage{};
  socklen_t _length{};
};

}  // namespace serve
