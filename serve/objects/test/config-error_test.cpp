#include "serve/config-error.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string_view>

namespace serve {

TEST(ConfigErrorTest, PathNotFoundNamesFieldAndPath) {
  const auto err = ConfigError::PathNotFound("tls.cert", "/nope/cert.pem");
  EXPECT_EQ(err.kind(), ConfigError::Kind::PathNotFound);
  EXPECT_EQ(err.field(), "tls.cert");
  EXPECT_EQ(err.path(), std::filesystem::path("/nope/cert.pem"));
  EXPECT_NE(std::string_view(err.what()).find("tls.cert"), std::string_view::npos);
  EXPECT_NE(std::string_view(err.what()).find("/nope/cert.pem"), std::string_view::npos);
}

TEST(ConfigErrorTest, InvalidCombinationNamesBothFields) {
  const auto err = ConfigError::InvalidCombination("ok", "not_found");
  EXPECT_EQ(err.kind(), ConfigError::Kind::InvalidCombination);
  EXPECT_EQ(err.field(), "ok");
  EXPECT_TRUE(err.path().empty());
  EXPECT_EQ(std::string_view(err.what()), "'ok' requires 'not_found' to be set");
}

TEST(ConfigErrorTest, IsARuntimeError) {
  try {
    throw ConfigError::IncompleteTls("tls.key");
  } catch (const std::runtime_error& err) {
    EXPECT_EQ(std::string_view(err.what()), "TLS is enabled but 'tls.key' is missing");
  }
}

}  // namespace serve
