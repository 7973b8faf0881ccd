#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "serve/tls-raii.hpp"
#include "serve/transport.hpp"

namespace serve {

// TLS transport over a non-blocking socket. The handshake is driven lazily by read() / write().
class TlsTransport : public ITransport {
 public:
  explicit TlsTransport(SslPtr sslPtr) : _ssl(std::move(sslPtr)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  [[nodiscard]] bool handshakeDone() const noexcept override { return _handshakeDone; }

  // Best-effort close_notify (non-blocking). Safe to call multiple times.
  void shutdown() noexcept override;

 private:
  TransportHint handshake(TransportHint want);

  void logErrorIfAny() const noexcept;

  SslPtr _ssl;
  bool _handshakeDone{false};
};

}  // namespace serve
