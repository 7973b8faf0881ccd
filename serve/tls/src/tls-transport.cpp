#include "serve/tls-transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

#include "serve/log.hpp"
#include "serve/transport.hpp"

namespace serve {

namespace {

bool IsRetry(int code) { return code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE; }

TransportHint RetryHint(int code) {
  return code == SSL_ERROR_WANT_WRITE ? TransportHint::WriteReady : TransportHint::ReadReady;
}

}  // namespace

ITransport::TransportResult TlsTransport::read(char* buf, std::size_t len) {
  TransportResult ret{0, handshake(TransportHint::ReadReady)};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  if (::SSL_read_ex(_ssl.get(), buf, len, &ret.bytesProcessed) == 1) [[likely]] {
    return ret;
  }
  ret.bytesProcessed = 0;

  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (err == SSL_ERROR_ZERO_RETURN) {
    // Clean shutdown from the peer.
    return ret;
  }
  if (IsRetry(err)) {
    ret.want = RetryHint(err);
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    ret.want = TransportHint::ReadReady;
    return ret;
  }
  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

ITransport::TransportResult TlsTransport::write(std::string_view data) {
  TransportResult ret{0, handshake(TransportHint::WriteReady)};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  // OpenSSL rejects zero-length writes on some builds.
  if (data.empty() || ::SSL_write_ex(_ssl.get(), data.data(), data.size(), &ret.bytesProcessed) == 1) {
    return ret;
  }
  ret.bytesProcessed = 0;

  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (IsRetry(err)) {
    // Caller must retry with the same data.
    ret.want = RetryHint(err);
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    ret.want = TransportHint::WriteReady;
    return ret;
  }
  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

void TlsTransport::shutdown() noexcept {
  if (_ssl && _handshakeDone) {
    // A single call sends our close_notify; we do not wait for the peer's one.
    ::SSL_shutdown(_ssl.get());
  }
}

TransportHint TlsTransport::handshake(TransportHint want) {
  if (_handshakeDone) {
    return TransportHint::None;
  }
  const int handshakeRet = ::SSL_do_handshake(_ssl.get());
  if (handshakeRet == 1) {
    _handshakeDone = true;
    log::debug("TLS handshake completed ({}, {})", ::SSL_get_version(_ssl.get()),
               ::SSL_get_cipher_name(_ssl.get()));
    return TransportHint::None;
  }
  const int err = ::SSL_get_error(_ssl.get(), handshakeRet);
  if (IsRetry(err)) {
    return RetryHint(err);
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    return want;
  }
  logErrorIfAny();
  return TransportHint::Error;
}

void TlsTransport::logErrorIfAny() const noexcept {
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    log::debug("TLS transport OpenSSL error: {} (handshake done={})", std::string_view(errBuf), _handshakeDone);
  }
}

}  // namespace serve
