#include "serve/http-server.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <exception>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "serve/connection.hpp"
#include "serve/event.hpp"
#include "serve/file.hpp"
#include "serve/http-method.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/http-status-code.hpp"
#include "serve/log.hpp"
#include "serve/request-handler.hpp"
#include "serve/signal-handler.hpp"
#include "serve/socket-address.hpp"
#include "serve/timedef.hpp"
#include "serve/tls-certificate-watcher.hpp"
#include "serve/tls-context.hpp"
#include "serve/tls-transport.hpp"
#include "serve/transport.hpp"

namespace serve {

HttpServer::HttpServer(const ServerConfig& config, const SocketAddress& address, bool reusePort,
                       std::unique_ptr<RequestHandler> handler, const std::optional<TlsSettings>& tls)
    : _config(config),
      _listenSocket(Socket::Type::StreamNonBlock, address.family()),
      _localAddress(address),
      _eventLoop(_config.pollInterval),
      _handler(std::move(handler)) {
  _config.validate();
  if (tls) {
    // Load first, so that a bad certificate fails before the port is taken.
    _tlsContext.emplace(tls->cert, tls->key);
    _certWatcher.emplace(tls->cert, tls->key);
  }
  _listenSocket.bindAndListen(address, reusePort);
  _localAddress = _listenSocket.localAddress();
  _port = _localAddress.port();
  _eventLoop.addOrThrow(EventLoop::EventFd{_listenSocket.fd(), EventIn});
  log::debug("Server bound to {} (fd # {})", _localAddress.str(), _listenSocket.fd());
}

HttpServer::~HttpServer() { closeAll(); }

void HttpServer::run() {
  _nextMaintenance = SteadyClock::now() + _config.pollInterval;
  try {
    while (!_stopRequested.load(std::memory_order_relaxed)) {
      eventLoopIteration();
    }
  } catch (...) {
    // Peers must not wait for answers that will never come.
    closeAll();
    _stopRequested.store(false, std::memory_order_relaxed);
    throw;
  }
  closeAll();
  _stopRequested.store(false, std::memory_order_relaxed);
  log::debug("Server on {} stopped", _localAddress.str());
}

void HttpServer::eventLoopIteration() {
  const auto events = _eventLoop.poll();
  if (events.data() == nullptr) [[unlikely]] {
    // epoll failure, already logged.
    stop();
    return;
  }

  for (const auto event : events) {
    if (event.fd == _listenSocket.fd()) {
      acceptNewConnections();
      continue;
    }
    auto cnxIt = _connections.find(event.fd);
    if (cnxIt == _connections.end()) {
      // Closed earlier in this batch.
      continue;
    }
    if ((event.eventBmp & (EventErr | EventHup)) != 0 && (event.eventBmp & EventIn) == 0) {
      closeConnection(cnxIt);
      continue;
    }
    handleConnectionEvent(cnxIt);
  }

  const auto now = SteadyClock::now();
  if (events.empty() || now >= _nextMaintenance) {
    maintenance(now);
    _nextMaintenance = now + _config.pollInterval;
  }
}

void HttpServer::maintenance(SteadyClock::time_point now) {
  if (SignalHandler::IsStopRequested()) {
    log::info("Stop requested, closing {} ({} connection(s))", _localAddress.str(), _connections.size());
    stop();
    return;
  }

  if (_config.keepAliveTimeout.count() > 0) {
    for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
      auto nextIt = std::next(cnxIt);
      if (now > cnxIt->second.lastActivity + _config.keepAliveTimeout) {
        log::debug("Closing idle connection fd # {}", cnxIt->first);
        closeConnection(cnxIt);
      }
      cnxIt = nextIt;
    }
  }

  if (_certWatcher) {
    if (auto newContext = _certWatcher->poll(now)) {
      _tlsContext = std::move(*newContext);
      log::info("Reloaded TLS certificate {} for {}", _certWatcher->certFile().string(), _localAddress.str());
    }
  }
}

void HttpServer::acceptNewConnections() {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int cnxFd = cnx.fd();
    static constexpr int kEnable = 1;
    if (::setsockopt(cnxFd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) != 0) {
      const auto err = errno;
      log::warn("setsockopt(TCP_NODELAY) failed for fd # {} err={} ({})", cnxFd, err, std::strerror(err));
    }

    std::unique_ptr<ITransport> transport;
    if (_tlsContext) {
      auto ssl = _tlsContext->newServerSsl(cnxFd);
      if (!ssl) {
        // Connection is dropped (and closed) here, error already logged.
        continue;
      }
      transport = std::make_unique<TlsTransport>(std::move(ssl));
    } else {
      transport = std::make_unique<PlainTransport>(cnxFd);
    }

    if (!_eventLoop.add(EventLoop::EventFd{cnxFd, EventIn | EventOut | EventRdHup | EventEt})) {
      continue;
    }

    auto [cnxIt, inserted] = _connections.try_emplace(cnxFd, ConnectionState{.connection = std::move(cnx),
                                                                              .transport = std::move(transport),
                                                                              .lastActivity = SteadyClock::now()});
    if (!inserted) [[unlikely]] {
      log::error("Internal error: accepted connection fd # {} already present in connection map", cnxFd);
      _eventLoop.del(cnxFd);
      continue;
    }
    log::trace("Accepted connection fd # {}", cnxFd);
    // Data may already be waiting (edge triggered registration).
    handleConnectionEvent(cnxIt);
  }
}

void HttpServer::handleConnectionEvent(ConnectionMap::iterator cnxIt) {
  ConnectionState& state = cnxIt->second;
  state.lastActivity = SteadyClock::now();
  if (!processConnection(state)) {
    closeConnection(cnxIt);
  }
}

bool HttpServer::processConnection(ConnectionState& state) {
  while (true) {
    switch (flush(state)) {
      case FlushStatus::Done:
        break;
      case FlushStatus::Blocked:
        // Resumed by the next writable (or, for TLS, readable) event.
        return true;
      case FlushStatus::Error:
        return false;
    }
    if (state.closeAfterFlush) {
      return false;
    }

    // Answer a complete request already buffered before reading more.
    if (!state.inBuffer.empty()) {
      HttpRequest request;
      const auto status = request.initTrySetHead(state.inBuffer, _config.maxHeaderBytes);
      if (status == http::StatusCodeOK) {
        answer(state, request);
        state.inBuffer.erase(0, request.headSpanSize());
        continue;
      }
      if (status != HttpRequest::kStatusNeedMoreData) {
        answerParseError(state, status);
        continue;
      }
    }

    const auto oldSize = state.inBuffer.size();
    state.inBuffer.resize(oldSize + _config.readChunkBytes);
    const auto [bytesRead, want] = state.transport->read(state.inBuffer.data() + oldSize, _config.readChunkBytes);
    state.inBuffer.resize(oldSize + bytesRead);
    if (bytesRead > 0) {
      continue;
    }
    switch (want) {
      case TransportHint::None:
        // Orderly close by the peer.
        return false;
      case TransportHint::ReadReady:
        [[fallthrough]];
      case TransportHint::WriteReady:
        return true;
      default:
        return false;
    }
  }
}

void HttpServer::answer(ConnectionState& state, const HttpRequest& request) {
  const auto start = SteadyClock::now();

  HttpResponse response;
  try {
    response = _handler->handle(request);
  } catch (const std::exception& ex) {
    log::error("Exception while handling {} {}: {}", http::MethodToStr(request.method()), request.target(),
               ex.what());
    response = HttpResponse(http::StatusCodeInternalServerError);
    response.body(std::string(http::ReasonPhrase(http::StatusCodeInternalServerError)));
  }

  const bool keepAlive = request.keepAlive() && !_stopRequested.load(std::memory_order_relaxed);
  state.outBuffer.append(response.serializeHead(SysClock::now(), keepAlive));
  const auto bodyLength = response.status() == http::StatusCodeNotModified ? 0 : response.bodyLength();
  if (request.method() != http::Method::HEAD && bodyLength != 0) {
    if (response.hasFile()) {
      state.filePayload = response.releaseFile();
    } else {
      state.outBuffer.append(response.bodyView());
    }
  }
  state.closeAfterFlush = !keepAlive;

  const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start);
  log::info("{} {} {} {} bytes {} us", http::MethodToStr(request.method()), request.target(),
            static_cast<int>(response.status()), bodyLength, latency.count());
}

void HttpServer::answerParseError(ConnectionState& state, http::StatusCode statusCode) {
  log::warn("Invalid request on fd # {}: {} {}", state.connection.fd(), static_cast<int>(statusCode),
            http::ReasonPhrase(statusCode));
  HttpResponse response(statusCode);
  std::string body(http::ReasonPhrase(statusCode));
  body.push_back('\n');
  response.body(std::move(body));
  state.outBuffer.append(response.serializeHead(SysClock::now(), false));
  state.outBuffer.append(response.bodyView());
  state.inBuffer.clear();
  state.closeAfterFlush = true;
}

HttpServer::FlushStatus HttpServer::flush(ConnectionState& state) {
  while (true) {
    while (state.outOffset < state.outBuffer.size()) {
      const std::string_view pending(state.outBuffer.data() + state.outOffset,
                                     state.outBuffer.size() - state.outOffset);
      const auto [bytesWritten, want] = state.transport->write(pending);
      state.outOffset += bytesWritten;
      if (want == TransportHint::Error) {
        return FlushStatus::Error;
      }
      if (want != TransportHint::None) {
        return FlushStatus::Blocked;
      }
    }
    state.outBuffer.clear();
    state.outOffset = 0;

    if (!state.filePayload) {
      return FlushStatus::Done;
    }
    FilePayload& payload = *state.filePayload;
    if (payload.length == 0) {
      state.filePayload.reset();
      return FlushStatus::Done;
    }

    const auto chunkSize = std::min(payload.length, _config.fileChunkBytes);
    state.outBuffer.resize(chunkSize);
    const auto bytesRead = payload.file.readAt(std::span<char>(state.outBuffer.data(), chunkSize), payload.offset);
    if (bytesRead == File::kError || bytesRead == 0) {
      // Content-Length was already sent, the body cannot be completed.
      log::error("Unable to read file body at offset {} for fd # {}", payload.offset, state.connection.fd());
      state.outBuffer.clear();
      return FlushStatus::Error;
    }
    state.outBuffer.resize(bytesRead);
    payload.offset += bytesRead;
    payload.length -= bytesRead;
  }
}

void HttpServer::closeConnection(ConnectionMap::iterator cnxIt) {
  const int fd = cnxIt->first;
  cnxIt->second.transport->shutdown();
  _eventLoop.del(fd);
  _connections.erase(cnxIt);
  log::trace("Closed connection fd # {}", fd);
}

void HttpServer::closeAll() {
  while (!_connections.empty()) {
    closeConnection(_connections.begin());
  }
}

}  // namespace serve
