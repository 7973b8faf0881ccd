#include "serve/socket.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <utility>

#include "serve/errno-throw.hpp"
#include "serve/log.hpp"
#include "serve/socket-address.hpp"

namespace serve {

namespace {

constexpr int kListenBacklog = SOMAXCONN;

int ComputeSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK;
    default:
      std::unreachable();
  }
}

void SetSocketOption(int fd, int level, int option, int value, const char* name) {
  if (::setsockopt(fd, level, option, &value, sizeof(value)) != 0) {
    throw_errno("setsockopt({}) failed for fd # {}", name, fd);
  }
}

}  // namespace

Socket::Socket(Type type, int family) : _baseFd(::socket(family, ComputeSocketType(type), 0)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(const SocketAddress& address, bool reusePort) {
  const int fd = _baseFd.fd();
  SetSocketOption(fd, SOL_SOCKET, SO_REUSEADDR, 1, "SO_REUSEADDR");
  if (reusePort) {
    SetSocketOption(fd, SOL_SOCKET, SO_REUSEPORT, 1, "SO_REUSEPORT");
  }
  if (address.family() == AF_INET6) {
    SetSocketOption(fd, IPPROTO_IPV6, IPV6_V6ONLY, 1, "IPV6_V6ONLY");
  }
  if (::bind(fd, address.data(), address.size()) != 0) {
    throw_errno("Unable to bind {}", address.str());
  }
  if (::listen(fd, kListenBacklog) != 0) {
    throw_errno("Unable to listen on {}", address.str());
  }
}

}  // namespace serve
