#include "serve/socket-address.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

#include "serve/errno-throw.hpp"

namespace serve {

std::optional<SocketAddress> SocketAddress::Parse(std::string_view ip, uint16_t port) {
  if (ip.size() > 2 && ip.front() == '[' && ip.back() == ']') {
    ip = ip.substr(1, ip.size() - 2);
  }
  if (ip.empty() || ip.size() >= INET6_ADDRSTRLEN) {
    return std::nullopt;
  }
  const std::string ipStr(ip);

  SocketAddress ret;
  auto* in4 = reinterpret_cast<sockaddr_in*>(&ret._storage);
  if (::inet_pton(AF_INET, ipStr.c_str(), &in4->sin_addr) == 1) {
    in4->sin_family = AF_INET;
    in4->sin_port = htons(port);
    ret._length = sizeof(sockaddr_in);
    return ret;
  }
  auto* in6 = reinterpret_cast<sockaddr_in6*>(&ret._storage);
  if (::inet_pton(AF_INET6, ipStr.c_str(), &in6->sin6_addr) == 1) {
    in6->sin6_family = AF_INET6;
    in6->sin6_port = htons(port);
    ret._length = sizeof(sockaddr_in6);
    return ret;
  }
  return std::nullopt;
}

SocketAddress SocketAddress::LocalOf(int fd) {
  SocketAddress ret;
  ret._length = sizeof(ret._storage);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ret._storage), &ret._length) != 0) {
    throw_errno("getsockname failed for fd # {}", fd);
  }
  return ret;
}

uint16_t SocketAddress::port() const noexcept {
  if (family() == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&_storage)->sin6_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in*>(&_storage)->sin_port);
}

std::string SocketAddress::str() const {
  char buf[INET6_ADDRSTRLEN]{};
  if (family() == AF_INET6) {
    ::inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6*>(&_storage)->sin6_addr, buf, sizeof(buf));
    return std::format("[{}]:{}", buf, port());
  }
  ::inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in*>(&_storage)->sin_addr, buf, sizeof(buf));
  return std::format("{}:{}", buf, port());
}

}  // namespace serve
