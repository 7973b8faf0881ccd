#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace serve {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation could not complete.
enum class TransportHint : uint8_t {
  None,        // No special action needed
  ReadReady,   // Need socket readable before operation can proceed (EAGAIN, SSL_ERROR_WANT_READ)
  WriteReady,  // Need socket writable before operation can proceed (EAGAIN, SSL_ERROR_WANT_WRITE)
  Error
};

// Base transport abstraction; allows transparent TLS or plain socket IO.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
    TransportHint want;
  };

  // Non-blocking read. bytesProcessed == 0 with want == None means orderly close by the peer.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write of as much of 'data' as possible.
  virtual TransportResult write(std::string_view data) = 0;

  [[nodiscard]] virtual bool handshakeDone() const noexcept { return true; }

  // Best effort graceful close notification (TLS close_notify). No-op for plain sockets.
  virtual void shutdown() noexcept {}
};

// Plain transport directly operates on a non-blocking fd.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

 private:
  int _fd;
};

}  // namespace serve
