#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace serve::test {

struct ClientResponse {
  int statusCode{};
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  // Case insensitive lookup, empty if absent.
  [[nodiscard]] std::string_view header(std::string_view name) const;

  [[nodiscard]] bool hasHeader(std::string_view name) const;
};

struct ClientOptions {
  std::string host{"127.0.0.1"};
  bool tls{false};
};

// Blocking client: connects, sends 'rawRequest' verbatim and reads until the server closes the connection.
// Returns the raw bytes received. Throws std::runtime_error on connection failure.
std::string SendRaw(uint16_t port, std::string_view rawRequest, const ClientOptions& options = {});

// Parses a raw HTTP/1.1 response (single response, Content-Length framed or until end of input).
ClientResponse ParseResponse(std::string_view raw);

// Sends 'method target' with 'Host' and 'Connection: close' headers plus 'extraHeaders'
// (each a complete "Name: value" line without CRLF) and parses the response.
ClientResponse Request(uint16_t port, std::string_view method, std::string_view target,
                       const std::vector<std::string>& extraHeaders = {}, const ClientOptions& options = {});

inline ClientResponse Get(uint16_t port, std::string_view target, const std::vector<std::string>& extraHeaders = {},
                          const ClientOptions& options = {}) {
  return Request(port, "GET", target, extraHeaders, options);
}

}  // namespace serve::test
