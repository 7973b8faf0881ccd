#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "serve/connection.hpp"
#include "serve/effective-config.hpp"
#include "serve/event-loop.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/request-handler.hpp"
#include "serve/server-config.hpp"
#include "serve/socket-address.hpp"
#include "serve/socket.hpp"
#include "serve/timedef.hpp"
#include "serve/tls-certificate-watcher.hpp"
#include "serve/tls-context.hpp"
#include "serve/transport.hpp"

namespace serve {

// HttpServer
//  - One listening socket and one epoll event loop, run in the thread calling run().
//  - HTTP/1.1 with keep-alive. Pipelined requests are answered sequentially, in order.
//  - File bodies are streamed with pread in fileChunkBytes chunks, never fully loaded (unless compressed).
//  - With TLS, the certificate and key files are watched on each maintenance tick and reloaded on change.
//    New connections use the new context, established ones keep theirs.
//  - Not internally synchronized, except stop() which may be called from any thread.
class HttpServer {
 public:
  // Binds and listens immediately. With port 0, an ephemeral port is chosen, see port().
  // Throws std::system_error if the socket cannot be bound, TlsLoadError if the certificate or key cannot be
  // loaded, std::invalid_argument if 'config' is invalid.
  HttpServer(const ServerConfig& config, const SocketAddress& address, bool reusePort,
             std::unique_ptr<RequestHandler> handler, const std::optional<TlsSettings>& tls = std::nullopt);

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Bound address, with the actual port.
  [[nodiscard]] const SocketAddress& localAddress() const noexcept { return _localAddress; }

  [[nodiscard]] bool isTls() const noexcept { return _tlsContext.has_value(); }

  // Serves until stop() is called or a termination signal is received (see SignalHandler).
  // Connections are closed without waiting for in-flight responses.
  // An exception escaping a request handler (other than a std::exception, answered with 500) closes every
  // connection and is rethrown.
  void run();

  // Asks run() to return at its next tick. Thread safe.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

 private:
  struct ConnectionState {
    Connection connection;
    std::unique_ptr<ITransport> transport;
    std::string inBuffer;
    // Pending output: serialized heads, in-memory bodies and the current file chunk.
    std::string outBuffer;
    std::size_t outOffset{};
    // Remaining part of the file body being streamed.
    std::optional<FilePayload> filePayload;
    SteadyClock::time_point lastActivity;
    bool closeAfterFlush{false};
  };

  enum class FlushStatus : uint8_t { Done, Blocked, Error };

  using ConnectionMap = std::unordered_map<int, ConnectionState>;

  void eventLoopIteration();

  void maintenance(SteadyClock::time_point now);

  void acceptNewConnections();

  void handleConnectionEvent(ConnectionMap::iterator cnxIt);

  // Processes buffered requests and reads more until the socket would block.
  // Returns false if the connection must be closed.
  bool processConnection(ConnectionState& state);

  void answer(ConnectionState& state, const HttpRequest& request);

  void answerParseError(ConnectionState& state, http::StatusCode statusCode);

  FlushStatus flush(ConnectionState& state);

  void closeConnection(ConnectionMap::iterator cnxIt);

  void closeAll();

  ServerConfig _config;
  Socket _listenSocket;
  SocketAddress _localAddress;
  EventLoop _eventLoop;
  std::unique_ptr<RequestHandler> _handler;
  std::optional<TlsContext> _tlsContext;
  std::optional<TlsCertificateWatcher> _certWatcher;
  ConnectionMap _connections;
  SteadyClock::time_point _nextMaintenance;
  uint16_t _port{};
  std::atomic<bool> _stopRequested{false};
};

}  // namespace serve
