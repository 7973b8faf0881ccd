#include "serve/multi-http-server.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

#include "serve/effective-config.hpp"
#include "serve/http-server.hpp"
#include "serve/log.hpp"
#include "serve/request-handler.hpp"
#include "serve/server-config.hpp"
#include "serve/socket-address.hpp"

namespace serve {

MultiHttpServer::MultiHttpServer(const ServerConfig& config, const SocketAddress& address,
                                 const RequestHandlerFactory& factory, const std::optional<TlsSettings>& tls) {
  const auto nbThreads = config.effectiveNbThreads();
  _servers.reserve(nbThreads);
  // The first server resolves an ephemeral port, the others bind the resolved address.
  _servers.push_back(std::make_unique<HttpServer>(config, address, true, factory(), tls));
  const SocketAddress resolvedAddress = _servers.front()->localAddress();
  for (uint32_t serverPos = 1; serverPos < nbThreads; ++serverPos) {
    _servers.push_back(std::make_unique<HttpServer>(config, resolvedAddress, true, factory(), tls));
  }
  log::debug("{} event loop(s) bound to {}", nbThreads, resolvedAddress.str());
}

MultiHttpServer::~MultiHttpServer() {
  stop();
  // jthread joins on destruction, before the servers are destroyed.
  _threads.clear();
}

void MultiHttpServer::start() {
  if (!_threads.empty()) {
    throw std::logic_error("MultiHttpServer is already started");
  }
  _threads.reserve(_servers.size());
  for (auto& server : _servers) {
    _threads.emplace_back([this, pServer = server.get()] {
      try {
        pServer->run();
      } catch (const std::exception& ex) {
        log::critical("Event loop on {} failed: {}", pServer->localAddress().str(), ex.what());
        recordFailure(std::current_exception());
      } catch (...) {
        log::critical("Event loop on {} failed with an unknown exception", pServer->localAddress().str());
        recordFailure(std::current_exception());
      }
    });
  }
}

void MultiHttpServer::recordFailure(std::exception_ptr error) {
  bool isFirst = false;
  {
    std::scoped_lock lock(_errorMutex);
    if (!_firstError) {
      _firstError = std::move(error);
      isFirst = true;
    }
  }
  // Rethrown by wait(), once every sibling loop has exited.
  stop();
  if (isFirst && _onFailure) {
    _onFailure();
  }
}

void MultiHttpServer::wait() {
  for (auto& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  _threads.clear();
  std::scoped_lock lock(_errorMutex);
  if (_firstError) {
    std::rethrow_exception(std::exchange(_firstError, nullptr));
  }
}

void MultiHttpServer::stop() noexcept {
  for (auto& server : _servers) {
    server->stop();
  }
}

}  // namespace serve
