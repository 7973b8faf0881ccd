#include "serve/http-server.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "serve/compression-config.hpp"
#include "serve/effective-config.hpp"
#include "serve/http-method.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/http-status-code.hpp"
#include "serve/request-handler.hpp"
#include "serve/server-config.hpp"
#include "serve/socket-address.hpp"
#include "serve/temp-file.hpp"
#include "serve/test-http-client.hpp"

namespace serve {

namespace {

using namespace std::chrono_literals;

// Answers "<METHOD> <target>", or throws on '/boom'.
class EchoHandler final : public RequestHandler {
 public:
  HttpResponse handle(const HttpRequest& request) override {
    if (request.target() == "/boom") {
      throw std::runtime_error("boom");
    }
    HttpResponse response;
    response.body(std::string(http::MethodToStr(request.method())) + ' ' + std::string(request.target()));
    return response;
  }
};

ServerConfig TestServerConfig() {
  ServerConfig config;
  config.nbThreads = 1;
  config.pollInterval = 20ms;
  return config;
}

SocketAddress Loopback() { return *SocketAddress::Parse("127.0.0.1", 0); }

// Runs an HttpServer in a background thread for the lifetime of the object.
class ServerRunner {
 public:
  ServerRunner(const ServerConfig& config, std::unique_ptr<RequestHandler> handler)
      : server(config, Loopback(), false, std::move(handler)), _loop([this] { server.run(); }) {}

  ServerRunner(const ServerRunner&) = delete;
  ServerRunner& operator=(const ServerRunner&) = delete;

  ~ServerRunner() {
    server.stop();
    _loop.join();
  }

  HttpServer server;

 private:
  std::jthread _loop;
};

}  // namespace

TEST(HttpServerTest, BindsEphemeralPort) {
  HttpServer server(TestServerConfig(), Loopback(), false, std::make_unique<EchoHandler>());
  EXPECT_NE(server.port(), 0);
  EXPECT_EQ(server.localAddress().port(), server.port());
  EXPECT_FALSE(server.isTls());
}

TEST(HttpServerTest, InvalidConfigThrows) {
  ServerConfig config = TestServerConfig();
  config.readChunkBytes = 0;
  EXPECT_THROW(HttpServer(config, Loopback(), false, std::make_unique<EchoHandler>()), std::invalid_argument);
}

TEST(HttpServerTest, SimpleGet) {
  ServerRunner runner(TestServerConfig(), std::make_unique<EchoHandler>());
  const auto response = test::Get(runner.server.port(), "/hello?x=1");
  EXPECT_EQ(response.statusCode, 200);
  EXPECT_EQ(response.body, "GET /hello?x=1");
  EXPECT_EQ(response.header("Content-Length"), "14");
  EXPECT_EQ(response.header("Connection"), "close");
  EXPECT_TRUE(response.hasHeader("Date"));
}

TEST(HttpServerTest, HeadHasNoBody) {
  ServerRunner runner(TestServerConfig(), std::make_unique<EchoHandler>());
  const auto raw =
      test::SendRaw(runner.server.port(), "HEAD /x HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
  const auto response = test::ParseResponse(raw);
  EXPECT_EQ(response.statusCode, 200);
  EXPECT_EQ(response.header("Content-Length"), "7");
  EXPECT_TRUE(raw.ends_with("\r\n\r\n"));
}

TEST(HttpServerTest, PipelinedRequestsAnsweredInOrder) {
  ServerRunner runner(TestServerConfig(), std::make_unique<EchoHandler>());
  const auto raw = test::SendRaw(runner.server.port(),
                                 "GET /first HTTP/1.1\r\nHost: localhost\r\n\r\n"
                                 "GET /second HTTP/1.1\r\nHost: localhost\r\n\r\n"
                                 "GET /third HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n");
  const auto first = raw.find("GET /first");
  const auto second = raw.find("GET /second");
  const auto third = raw.find("GET /third");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  ASSERT_NE(third, std::string::npos);
  EXPECT_LT(first, second);
  EXPECT_LT(second, third);
  EXPECT_NE(raw.find("Connection: keep-alive"), std::string::npos);
}

TEST(HttpServerTest, HandlerExceptionGives500) {
  ServerRunner runner(TestServerConfig(), std::make_unique<EchoHandler>());
  const auto response = test::Get(runner.server.port(), "/boom");
  EXPECT_EQ(response.statusCode, 500);
}

TEST(HttpServerTest, OversizedHeadGives431) {
  ServerConfig config = TestServerConfig();
  config.maxHeaderBytes = 256;
  ServerRunner runner(config, std::make_unique<EchoHandler>());
  const auto response =
      test::Get(runner.server.port(), "/big", {"X-Filler: " + std::string(1024, 'a')});
  EXPECT_EQ(response.statusCode, 431);
}

TEST(HttpServerTest, MalformedRequestGives400) {
  ServerRunner runner(TestServerConfig(), std::make_unique<EchoHandler>());
  const auto response = test::ParseResponse(test::SendRaw(runner.server.port(), "GET / HTTX/1.1\r\n\r\n"));
  EXPECT_EQ(response.statusCode, 400);
}

TEST(HttpServerTest, LargeFileStreamedInChunks) {
  test::ScopedTempDir tmpDir;
  std::string content;
  content.reserve(1 << 20);
  for (std::size_t pos = 0; pos < (1U << 20); ++pos) {
    content.push_back(static_cast<char>('a' + (pos % 26)));
  }
  tmpDir.writeFile("big.txt", content);

  auto effectiveConfig = std::make_shared<EffectiveConfig>();
  effectiveConfig->path = tmpDir.dirPath();
  effectiveConfig->compressionEnabled = false;

  ServerConfig config = TestServerConfig();
  config.fileChunkBytes = 4096;
  ServerRunner runner(config, std::make_unique<StaticFilesHandler>(effectiveConfig, CompressionConfig{}));
  const auto response = test::Get(runner.server.port(), "/big.txt");
  EXPECT_EQ(response.statusCode, 200);
  EXPECT_EQ(response.header("Content-Length"), std::to_string(content.size()));
  EXPECT_EQ(response.body, content);
}

TEST(HttpServerTest, RedirectHandler) {
  ServerRunner runner(TestServerConfig(), std::make_unique<HttpsRedirectHandler>());
  const auto response = test::ParseResponse(test::SendRaw(
      runner.server.port(), "GET /docs?page=2 HTTP/1.1\r\nHost: localhost:80\r\nConnection: close\r\n\r\n"));
  EXPECT_EQ(response.statusCode, 308);
  EXPECT_EQ(response.header("Location"), "https://localhost:443/docs?page=2");
}

TEST(HttpServerTest, StopEndsRun) {
  HttpServer server(TestServerConfig(), Loopback(), false, std::make_unique<EchoHandler>());
  std::jthread loop([&server] { server.run(); });
  std::this_thread::sleep_for(50ms);
  server.stop();
  loop.join();
  SUCCEED();
}

}  // namespace serve
