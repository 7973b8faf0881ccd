#include "serve/tls-context.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <filesystem>
#include <format>
#include <string>
#include <string_view>

#include "serve/log.hpp"
#include "serve/tls-raii.hpp"

namespace serve {

namespace {

// Pops the whole OpenSSL error queue and returns the most recent reason.
std::string LastOpenSslError() {
  std::string reason = "unknown OpenSSL error";
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    reason = errBuf;
  }
  return reason;
}

void LoadCertificateAndKey(SSL_CTX* ctx, const std::filesystem::path& certFile,
                           const std::filesystem::path& keyFile) {
  if (::SSL_CTX_use_certificate_chain_file(ctx, certFile.c_str()) != 1) {
    throw TlsLoadError(std::format("Failed to load certificate '{}': {}", certFile.string(), LastOpenSslError()));
  }
  if (::SSL_CTX_use_PrivateKey_file(ctx, keyFile.c_str(), SSL_FILETYPE_PEM) != 1) {
    throw TlsLoadError(std::format("Failed to load private key '{}': {}", keyFile.string(), LastOpenSslError()));
  }
  if (::SSL_CTX_check_private_key(ctx) != 1) {
    throw TlsLoadError(std::format("Private key '{}' does not match certificate '{}': {}", keyFile.string(),
                                   certFile.string(), LastOpenSslError()));
  }
}

}  // namespace

TlsContext::TlsContext(const std::filesystem::path& certFile, const std::filesystem::path& keyFile)
    : _ctx(::SSL_CTX_new(::TLS_server_method()), ::SSL_CTX_free) {
  if (!_ctx) {
    throw TlsLoadError(std::format("SSL_CTX_new failed: {}", LastOpenSslError()));
  }
  ::SSL_CTX_set_min_proto_version(_ctx.get(), TLS1_2_VERSION);
  ::SSL_CTX_set_options(_ctx.get(), SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);
  ::SSL_CTX_set_mode(_ctx.get(), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

  LoadCertificateAndKey(_ctx.get(), certFile, keyFile);

  log::debug("TLS context loaded from certificate '{}' and key '{}'", certFile.string(), keyFile.string());
}

SslPtr TlsContext::newServerSsl(int fd) const {
  SslPtr ssl(::SSL_new(_ctx.get()), ::SSL_free);
  if (!ssl) {
    log::error("SSL_new failed for fd # {}: {}", fd, LastOpenSslError());
    return ssl;
  }
  if (::SSL_set_fd(ssl.get(), fd) != 1) {
    log::error("SSL_set_fd failed for fd # {}: {}", fd, LastOpenSslError());
    ssl.reset();
    return ssl;
  }
  ::SSL_set_accept_state(ssl.get());
  return ssl;
}

}  // namespace serve
