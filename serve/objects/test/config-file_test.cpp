#include "serve/config-file.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "serve/config-error.hpp"
#include "serve/log.hpp"
#include "serve/temp-file.hpp"

namespace serve {

TEST(ConfigFileTest, ParseAllKeys) {
  const auto configFile = ConfigFile::Parse(R"(
path = "/srv/www"
port = 8080
addr = "0.0.0.0"
disable_compression = true
not_found = "/srv/www/404.html"
ok = true
log_level = "debug"
log_path = "/var/log/serve"
log_max_files = 3

[tls]
cert = "/etc/serve/cert.pem"
key = "/etc/serve/key.pem"
redirect_http = true
)");

  EXPECT_EQ(configFile.path, std::filesystem::path("/srv/www"));
  EXPECT_EQ(configFile.port, 8080);
  EXPECT_EQ(configFile.addr, "0.0.0.0");
  EXPECT_EQ(configFile.disableCompression, true);
  EXPECT_EQ(configFile.notFound, std::filesystem::path("/srv/www/404.html"));
  EXPECT_EQ(configFile.ok, true);
  EXPECT_EQ(configFile.logLevel, log::level::debug);
  EXPECT_EQ(configFile.logPath, std::filesystem::path("/var/log/serve"));
  EXPECT_EQ(configFile.logMaxFiles, 3U);
  ASSERT_TRUE(configFile.tls.has_value());
  EXPECT_EQ(configFile.tls->cert, std::filesystem::path("/etc/serve/cert.pem"));
  EXPECT_EQ(configFile.tls->key, std::filesystem::path("/etc/serve/key.pem"));
  EXPECT_EQ(configFile.tls->redirectHttp, true);
}

TEST(ConfigFileTest, MissingKeysAreUnset) {
  const auto configFile = ConfigFile::Parse("port = 4000\n");
  EXPECT_EQ(configFile.port, 4000);
  EXPECT_FALSE(configFile.path);
  EXPECT_FALSE(configFile.addr);
  EXPECT_FALSE(configFile.disableCompression);
  EXPECT_FALSE(configFile.logLevel);
  EXPECT_FALSE(configFile.tls);
}

TEST(ConfigFileTest, UnknownKeysIgnored) {
  const auto configFile = ConfigFile::Parse("port = 4000\nfoo = \"bar\"\n[extra]\nx = 1\n");
  EXPECT_EQ(configFile.port, 4000);
}

TEST(ConfigFileTest, PartialTlsSection) {
  const auto configFile = ConfigFile::Parse("[tls]\ncert = \"c.pem\"\n");
  ASSERT_TRUE(configFile.tls);
  EXPECT_EQ(configFile.tls->cert, std::filesystem::path("c.pem"));
  EXPECT_FALSE(configFile.tls->key);
  EXPECT_FALSE(configFile.tls->redirectHttp);
}

TEST(ConfigFileTest, MalformedTomlIsParseFailure) {
  try {
    ConfigFile::Parse("port = = 3\n", "broken.toml");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err.kind(), ConfigError::Kind::ParseFailure);
    EXPECT_EQ(err.path(), std::filesystem::path("broken.toml"));
  }
}

TEST(ConfigFileTest, WrongTypeIsParseFailure) {
  try {
    ConfigFile::Parse("port = \"eighty\"\n");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err.kind(), ConfigError::Kind::ParseFailure);
    EXPECT_NE(std::string(err.what()).find("port"), std::string::npos);
  }
  EXPECT_THROW(ConfigFile::Parse("ok = 1\n"), ConfigError);
  EXPECT_THROW(ConfigFile::Parse("tls = 3\n"), ConfigError);
  EXPECT_THROW(ConfigFile::Parse("[tls]\nredirect_http = \"yes\"\n"), ConfigError);
}

TEST(ConfigFileTest, PortOutOfRangeIsParseFailure) {
  EXPECT_THROW(ConfigFile::Parse("port = 65536\n"), ConfigError);
  EXPECT_THROW(ConfigFile::Parse("port = -1\n"), ConfigError);
  EXPECT_EQ(ConfigFile::Parse("port = 65535\n").port, 65535);
}

TEST(ConfigFileTest, UnknownLogLevelIsInvalidValue) {
  try {
    ConfigFile::Parse("log_level = \"loud\"\n");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err.kind(), ConfigError::Kind::InvalidValue);
    EXPECT_EQ(err.field(), "log_level");
  }
}

TEST(ConfigFileTest, SerializeStartsWithHeaderAndSkipsUnsetFields) {
  ConfigFile configFile;
  configFile.port = 3000;
  configFile.addr = "127.0.0.1";

  const auto content = configFile.serialize();
  EXPECT_TRUE(content.starts_with("# Configuration for serve"));
  EXPECT_NE(content.find("port = 3000"), std::string::npos);
  EXPECT_NE(content.find("addr = "), std::string::npos);
  EXPECT_NE(content.find("127.0.0.1"), std::string::npos);
  EXPECT_EQ(content.find("not_found"), std::string::npos);
  EXPECT_EQ(content.find("[tls]"), std::string::npos);
}

TEST(ConfigFileTest, SaveThenLoadKeepsEverySetting) {
  test::ScopedTempDir dir;
  ConfigFile configFile;
  configFile.path = dir.dirPath();
  configFile.port = 8443;
  configFile.addr = "::1";
  configFile.disableCompression = false;
  configFile.ok = false;
  configFile.logLevel = log::level::warn;
  configFile.logMaxFiles = 7;
  configFile.tls.emplace();
  configFile.tls->cert = dir.dirPath() / "server.crt";
  configFile.tls->key = dir.dirPath() / "server.key";
  configFile.tls->redirectHttp = false;

  const auto filePath = dir.dirPath() / "nested" / "serve.toml";
  configFile.save(filePath);
  ASSERT_TRUE(std::filesystem::is_regular_file(filePath));

  EXPECT_EQ(ConfigFile::Load(filePath), configFile);
}

TEST(ConfigFileTest, LoadMissingFileIsParseFailure) {
  test::ScopedTempDir dir;
  EXPECT_THROW(ConfigFile::Load(dir.dirPath() / "absent.toml"), ConfigError);
}

}  // namespace serve
