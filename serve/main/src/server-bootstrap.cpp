#include "serve/server-bootstrap.hpp"

#include <cstdint>
#include <exception>
#include <initializer_list>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "serve/config-error.hpp"
#include "serve/effective-config.hpp"
#include "serve/log.hpp"
#include "serve/multi-http-server.hpp"
#include "serve/request-handler.hpp"
#include "serve/server-config.hpp"
#include "serve/socket-address.hpp"

namespace serve {

namespace {

SocketAddress MakeAddress(const EffectiveConfig& config, uint16_t port) {
  auto address = SocketAddress::Parse(config.addr, port);
  if (!address) {
    throw ConfigError::InvalidValue("addr", "expected an IPv4 or IPv6 address");
  }
  return *address;
}

RequestHandlerFactory StaticFilesFactory(std::shared_ptr<const EffectiveConfig> config,
                                         const ServerConfig& serverConfig) {
  return [config = std::move(config), compression = serverConfig.compression] {
    return std::make_unique<StaticFilesHandler>(config, compression);
  };
}

RequestHandlerFactory RedirectFactory() {
  return [] { return std::make_unique<HttpsRedirectHandler>(); };
}

}  // namespace

Topology DecideTopology(const EffectiveConfig& config) {
  if (!config.tls) {
    return PlainTopology{};
  }
  if (config.tls->redirectHttp) {
    if (config.port == kHttpsPort) {
      return TlsWithRedirectTopology{*config.tls};
    }
    log::error("HTTP to HTTPS redirect is only available when listening on port {} (current port: {}), ignoring it",
               kHttpsPort, config.port);
  }
  return TlsTopology{*config.tls};
}

ServerBootstrap::ServerBootstrap(std::shared_ptr<const EffectiveConfig> config, const ServerConfig& serverConfig)
    : _config(std::move(config)), _topology(DecideTopology(*_config)) {
  const SocketAddress mainAddress = MakeAddress(*_config, _config->port);

  std::visit(
      [&](const auto& topology) {
        using T = std::decay_t<decltype(topology)>;
        if constexpr (std::is_same_v<T, PlainTopology>) {
          _mainServer =
              std::make_unique<MultiHttpServer>(serverConfig, mainAddress, StaticFilesFactory(_config, serverConfig));
          log::info("listening on {}", _mainServer->localAddress().str());
        } else {
          _mainServer = std::make_unique<MultiHttpServer>(serverConfig, mainAddress,
                                                          StaticFilesFactory(_config, serverConfig), topology.tls);
          log::info("listening on {} with TLS", _mainServer->localAddress().str());
          if constexpr (std::is_same_v<T, TlsWithRedirectTopology>) {
            _redirectServer = std::make_unique<MultiHttpServer>(serverConfig, MakeAddress(*_config, kHttpPort),
                                                                RedirectFactory());
            log::info("redirecting HTTP requests on {} to HTTPS", _redirectServer->localAddress().str());
          }
        }
      },
      _topology);
}

std::optional<uint16_t> ServerBootstrap::redirectPort() const noexcept {
  if (!_redirectServer) {
    return std::nullopt;
  }
  return _redirectServer->port();
}

void ServerBootstrap::start() {
  if (_redirectServer) {
    // A listener that dies takes the other one down with it.
    _mainServer->onFailure([this] { _redirectServer->stop(); });
    _redirectServer->onFailure([this] { _mainServer->stop(); });
  }
  _mainServer->start();
  if (_redirectServer) {
    _redirectServer->start();
  }
}

void ServerBootstrap::wait() {
  std::exception_ptr firstError;
  for (MultiHttpServer* pServer : {_mainServer.get(), _redirectServer.get()}) {
    if (pServer == nullptr) {
      continue;
    }
    try {
      pServer->wait();
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }
  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

void ServerBootstrap::run() {
  start();
  wait();
}

void ServerBootstrap::stop() noexcept {
  _mainServer->stop();
  if (_redirectServer) {
    _redirectServer->stop();
  }
}

}  // namespace serve
