#include "serve/test-http-client.hpp"

#include <netinet/in.h>
#include <openssl/ssl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "serve/base-fd.hpp"
#include "serve/socket-address.hpp"
#include "serve/string-helpers.hpp"

namespace serve::test {

namespace {

BaseFd ConnectBlocking(const std::string& host, uint16_t port) {
  auto addr = SocketAddress::Parse(host, port);
  if (!addr) {
    throw std::runtime_error(std::format("invalid test client host '{}'", host));
  }
  BaseFd fd(::socket(addr->family(), SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd) {
    throw std::runtime_error("test client: socket() failed");
  }
  timeval timeout{.tv_sec = 5, .tv_usec = 0};
  ::setsockopt(fd.fd(), SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
  ::setsockopt(fd.fd(), SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
  if (::connect(fd.fd(), addr->data(), addr->size()) != 0) {
    throw std::runtime_error(std::format("test client: connect to {} failed", addr->str()));
  }
  return fd;
}

std::string ExchangePlain(int fd, std::string_view rawRequest) {
  std::size_t sent = 0;
  while (sent < rawRequest.size()) {
    const auto ret = ::send(fd, rawRequest.data() + sent, rawRequest.size() - sent, MSG_NOSIGNAL);
    if (ret <= 0) {
      throw std::runtime_error("test client: send failed");
    }
    sent += static_cast<std::size_t>(ret);
  }
  std::string out;
  char buf[16384];
  while (true) {
    const auto ret = ::recv(fd, buf, sizeof(buf), 0);
    if (ret <= 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(ret));
  }
  return out;
}

std::string ExchangeTls(int fd, std::string_view rawRequest) {
  std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)> ctx(::SSL_CTX_new(TLS_client_method()), &::SSL_CTX_free);
  if (!ctx) {
    throw std::runtime_error("test client: SSL_CTX_new failed");
  }
  ::SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
  std::unique_ptr<SSL, decltype(&::SSL_free)> ssl(::SSL_new(ctx.get()), &::SSL_free);
  if (!ssl || ::SSL_set_fd(ssl.get(), fd) != 1 || ::SSL_connect(ssl.get()) != 1) {
    throw std::runtime_error("test client: TLS handshake failed");
  }
  std::size_t written = 0;
  if (!rawRequest.empty() && ::SSL_write_ex(ssl.get(), rawRequest.data(), rawRequest.size(), &written) != 1) {
    throw std::runtime_error("test client: SSL_write failed");
  }
  std::string out;
  char buf[16384];
  std::size_t nbRead = 0;
  while (::SSL_read_ex(ssl.get(), buf, sizeof(buf), &nbRead) == 1) {
    out.append(buf, nbRead);
  }
  return out;
}

}  // namespace

std::string_view ClientResponse::header(std::string_view name) const {
  for (const auto& [headerName, value] : headers) {
    if (CaseInsensitiveEqual(headerName, name)) {
      return value;
    }
  }
  return {};
}

bool ClientResponse::hasHeader(std::string_view name) const {
  for (const auto& header : headers) {
    if (CaseInsensitiveEqual(header.first, name)) {
      return true;
    }
  }
  return false;
}

std::string SendRaw(uint16_t port, std::string_view rawRequest, const ClientOptions& options) {
  BaseFd fd = ConnectBlocking(options.host, port);
  return options.tls ? ExchangeTls(fd.fd(), rawRequest) : ExchangePlain(fd.fd(), rawRequest);
}

ClientResponse ParseResponse(std::string_view raw) {
  ClientResponse resp;
  const auto headEnd = raw.find("\r\n\r\n");
  if (headEnd == std::string_view::npos) {
    throw std::runtime_error(std::format("test client: incomplete response head ({} bytes)", raw.size()));
  }
  std::string_view head = raw.substr(0, headEnd);

  auto lineEnd = head.find("\r\n");
  const std::string_view statusLine = head.substr(0, lineEnd);
  // HTTP/1.1 200 OK
  if (statusLine.size() < 12) {
    throw std::runtime_error("test client: malformed status line");
  }
  std::from_chars(statusLine.data() + 9, statusLine.data() + 12, resp.statusCode);
  if (statusLine.size() > 13) {
    resp.reason = statusLine.substr(13);
  }

  while (lineEnd != std::string_view::npos) {
    head.remove_prefix(lineEnd + 2);
    lineEnd = head.find("\r\n");
    const std::string_view line = head.substr(0, lineEnd);
    const auto colonPos = line.find(':');
    if (colonPos != std::string_view::npos) {
      resp.headers.emplace_back(line.substr(0, colonPos), TrimOws(line.substr(colonPos + 1)));
    }
  }

  std::string_view body = raw.substr(headEnd + 4);
  const std::string_view contentLength = resp.header("Content-Length");
  if (!contentLength.empty()) {
    std::size_t len = 0;
    std::from_chars(contentLength.data(), contentLength.data() + contentLength.size(), len);
    if (len < body.size()) {
      body = body.substr(0, len);
    }
  }
  resp.body = body;
  return resp;
}

ClientResponse Request(uint16_t port, std::string_view method, std::string_view target,
                       const std::vector<std::string>& extraHeaders, const ClientOptions& options) {
  std::string raw = std::format("{} {} HTTP/1.1\r\nHost: localhost:{}\r\nConnection: close\r\n", method, target, port);
  for (const auto& header : extraHeaders) {
    raw.append(header).append("\r\n");
  }
  raw.append("\r\n");
  return ParseResponse(SendRaw(port, raw, options));
}

}  // namespace serve::test
