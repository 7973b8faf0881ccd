#pragma once

#include <filesystem>
#include <stdexcept>

#include "serve/tls-raii.hpp"

namespace serve {

// Raised when the certificate or private key cannot be loaded (unreadable, not PEM, mismatched pair).
class TlsLoadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// RAII wrapper around a server SSL_CTX loaded from PEM certificate (chain) and private key files.
class TlsContext {
 public:
  // Throws TlsLoadError if the files cannot be loaded.
  TlsContext(const std::filesystem::path& certFile, const std::filesystem::path& keyFile);

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;
  TlsContext(TlsContext&&) noexcept = default;
  TlsContext& operator=(TlsContext&&) noexcept = default;

  ~TlsContext() = default;

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

  // Creates a new server-side SSL object for an accepted (non-blocking) socket.
  // Returns an empty pointer on failure (logged).
  [[nodiscard]] SslPtr newServerSsl(int fd) const;

 private:
  SslCtxPtr _ctx;
};

}  // namespace serve
