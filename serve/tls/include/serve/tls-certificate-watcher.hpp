#pragma once

#include <chrono>
#include <filesystem>
#include <optional>

#include "serve/timedef.hpp"
#include "serve/tls-context.hpp"

namespace serve {

// Watches a certificate / private key pair on disk and rebuilds a TlsContext when either file changes.
// Not thread safe: each event loop owns its own watcher.
class TlsCertificateWatcher {
 public:
  static constexpr std::chrono::seconds kInitialBackoff{1};
  static constexpr std::chrono::seconds kMaxBackoff{64};

  // Captures the current modification times of both files.
  TlsCertificateWatcher(std::filesystem::path certFile, std::filesystem::path keyFile);

  // Checks the files for modification. Returns a freshly loaded context when a change was detected
  // and the new files load correctly. A failed reload is logged and retried with exponential backoff,
  // the caller keeps its current context in the meantime.
  std::optional<TlsContext> poll(SteadyClock::time_point now);

  // Backoff applied after the last failed reload, zero if the last attempt succeeded.
  [[nodiscard]] std::chrono::seconds currentBackoff() const noexcept { return _backoff; }

  [[nodiscard]] const std::filesystem::path& certFile() const noexcept { return _certFile; }
  [[nodiscard]] const std::filesystem::path& keyFile() const noexcept { return _keyFile; }

 private:
  struct Stamps {
    std::filesystem::file_time_type cert;
    std::filesystem::file_time_type key;

    bool operator==(const Stamps&) const noexcept = default;
  };

  [[nodiscard]] Stamps currentStamps() const;

  std::filesystem::path _certFile;
  std::filesystem::path _keyFile;
  Stamps _stamps;
  SteadyClock::time_point _nextAttempt;
  std::chrono::seconds _backoff{0};
  bool _reloadPending{false};
};

}  // namespace serve
