#include "serve/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>

#include "serve/log.hpp"
#include "serve/socket.hpp"

namespace serve {

namespace {

int AcceptConnectionFd(int socketFd) {
  sockaddr_storage peerAddr{};
  socklen_t peerLen = sizeof(peerAddr);
  const int fd =
      ::accept4(socketFd, reinterpret_cast<sockaddr*>(&peerAddr), &peerLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("No more pending connection on socket fd # {}", socketFd);
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, std::strerror(savedErr));
    }
    return BaseFd::kClosedFd;
  }
  log::debug("Connection fd # {} opened", fd);
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(AcceptConnectionFd(socket.fd())) {}

}  // namespace serve
