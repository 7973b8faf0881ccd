#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>

#include "serve/effective-config.hpp"
#include "serve/multi-http-server.hpp"
#include "serve/server-config.hpp"

namespace serve {

inline constexpr uint16_t kHttpsPort = 443;
inline constexpr uint16_t kHttpPort = 80;

// Plain HTTP on addr:port.
struct PlainTopology {
  bool operator==(const PlainTopology&) const = default;
};

// HTTPS on addr:port.
struct TlsTopology {
  TlsSettings tls;

  bool operator==(const TlsTopology&) const = default;
};

// HTTPS on addr:443, plus plain HTTP on addr:80 redirecting to it.
struct TlsWithRedirectTopology {
  TlsSettings tls;

  bool operator==(const TlsWithRedirectTopology&) const = default;
};

using Topology = std::variant<PlainTopology, TlsTopology, TlsWithRedirectTopology>;

// Listeners to start for 'config'. A redirect requested on a port other than 443 is ignored and logged as an error.
Topology DecideTopology(const EffectiveConfig& config);

// Starts the listeners of the topology chosen for an effective configuration.
class ServerBootstrap {
 public:
  // Binds every listener. Throws std::system_error if an address cannot be bound, TlsLoadError if the
  // certificate or key cannot be loaded.
  explicit ServerBootstrap(std::shared_ptr<const EffectiveConfig> config, const ServerConfig& serverConfig = {});

  [[nodiscard]] const Topology& topology() const noexcept { return _topology; }

  // Port of the main (HTTP or HTTPS) listener.
  [[nodiscard]] uint16_t port() const noexcept { return _mainServer->port(); }

  // Port of the HTTP to HTTPS redirect listener, if any.
  [[nodiscard]] std::optional<uint16_t> redirectPort() const noexcept;

  // Launches the event loop threads. Non blocking.
  void start();

  // Blocks until every listener stopped, then rethrows the first event loop error, if any.
  // An event loop error on one listener stops the other one.
  void wait();

  // start() then wait(): serves until SIGINT / SIGTERM or stop().
  void run();

  // Thread safe.
  void stop() noexcept;

 private:
  std::shared_ptr<const EffectiveConfig> _config;
  Topology _topology;
  std::unique_ptr<MultiHttpServer> _mainServer;
  std::unique_ptr<MultiHttpServer> _redirectServer;
};

}  // namespace serve
