#include "serve/server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace serve {

TEST(ServerConfigTest, DefaultIsValid) {
  ServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.pollInterval, std::chrono::milliseconds{500});
  EXPECT_EQ(config.maxHeaderBytes, 16U * 1024U);
  EXPECT_EQ(config.keepAliveTimeout, std::chrono::seconds{30});
}

TEST(ServerConfigTest, InvalidValues) {
  ServerConfig config;
  config.pollInterval = std::chrono::milliseconds{0};
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = ServerConfig{};
  config.maxHeaderBytes = 64;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = ServerConfig{};
  config.fileChunkBytes = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = ServerConfig{};
  config.compression.minBytes = 10;
  config.compression.maxBytes = 1;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(ServerConfigTest, EffectiveNbThreads) {
  ServerConfig config;
  EXPECT_GE(config.effectiveNbThreads(), 1U);
  config.nbThreads = 3;
  EXPECT_EQ(config.effectiveNbThreads(), 3U);
}

}  // namespace serve
