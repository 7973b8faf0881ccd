#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "serve/effective-config.hpp"
#include "serve/http-server.hpp"
#include "serve/request-handler.hpp"
#include "serve/server-config.hpp"
#include "serve/socket-address.hpp"

namespace serve {

// MultiHttpServer: N HttpServer instances (each with its own event loop and thread) listening on the same
// address via SO_REUSEPORT. The kernel balances incoming connections between them.
//  - All listeners are bound by the constructor, in the calling thread: bind and certificate errors surface
//    there. If the address port is 0, the first server picks an ephemeral port and the others reuse it.
//  - The handler factory is invoked once per server, so that handlers keep per-thread state.
class MultiHttpServer {
 public:
  MultiHttpServer(const ServerConfig& config, const SocketAddress& address, const RequestHandlerFactory& factory,
                  const std::optional<TlsSettings>& tls = std::nullopt);

  MultiHttpServer(const MultiHttpServer&) = delete;
  MultiHttpServer& operator=(const MultiHttpServer&) = delete;
  MultiHttpServer(MultiHttpServer&&) = delete;
  MultiHttpServer& operator=(MultiHttpServer&&) = delete;

  // Stops and joins the threads.
  ~MultiHttpServer();

  [[nodiscard]] uint16_t port() const noexcept { return _servers.front()->port(); }

  [[nodiscard]] const SocketAddress& localAddress() const noexcept { return _servers.front()->localAddress(); }

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _servers.size(); }

  // Called once, from the failing event loop thread, when an event loop exits with an exception.
  // Every event loop of this object is already asked to stop at that point. Set it before start().
  void onFailure(std::function<void()> callback) { _onFailure = std::move(callback); }

  // Launches one thread per server. Non blocking.
  void start();

  // Blocks until every event loop returned (after stop() or a termination signal), then rethrows the first
  // exception raised by an event loop, if any.
  void wait();

  // Asks every event loop to stop, without waiting for them. Thread safe.
  void stop() noexcept;

 private:
  std::vector<std::unique_ptr<HttpServer>> _servers;
  std::vector<std::jthread> _threads;
  std::function<void()> _onFailure;
  std::mutex _errorMutex;
  std::exception_ptr _firstError;

  void recordFailure(std::exception_ptr error);
};

}  // namespace serve
