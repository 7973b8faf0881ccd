#include "serve/tls-certificate-watcher.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

#include "serve/log.hpp"
#include "serve/timedef.hpp"
#include "serve/tls-context.hpp"

namespace serve {

TlsCertificateWatcher::TlsCertificateWatcher(std::filesystem::path certFile, std::filesystem::path keyFile)
    : _certFile(std::move(certFile)), _keyFile(std::move(keyFile)), _stamps(currentStamps()) {}

TlsCertificateWatcher::Stamps TlsCertificateWatcher::currentStamps() const {
  // A missing file yields file_time_type::min(), which is seen as a change and reported by the reload.
  std::error_code ec;
  Stamps stamps;
  stamps.cert = std::filesystem::last_write_time(_certFile, ec);
  if (ec) {
    stamps.cert = std::filesystem::file_time_type::min();
  }
  stamps.key = std::filesystem::last_write_time(_keyFile, ec);
  if (ec) {
    stamps.key = std::filesystem::file_time_type::min();
  }
  return stamps;
}

std::optional<TlsContext> TlsCertificateWatcher::poll(SteadyClock::time_point now) {
  if (_reloadPending && now < _nextAttempt) {
    return std::nullopt;
  }
  const Stamps stamps = currentStamps();
  if (!_reloadPending && stamps == _stamps) [[likely]] {
    return std::nullopt;
  }
  _stamps = stamps;

  try {
    TlsContext ctx(_certFile, _keyFile);
    log::info("TLS certificate '{}' reloaded", _certFile.string());
    _reloadPending = false;
    _backoff = std::chrono::seconds{0};
    return ctx;
  } catch (const TlsLoadError& ex) {
    _backoff = _backoff == std::chrono::seconds{0} ? kInitialBackoff : std::min(_backoff * 2, kMaxBackoff);
    _reloadPending = true;
    _nextAttempt = now + _backoff;
    log::error("TLS certificate reload failed, keeping previous one (retry in {}s): {}", _backoff.count(),
               ex.what());
  }
  return std::nullopt;
}

}  // namespace serve
