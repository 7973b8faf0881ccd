#include "serve/config-resolver.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>

#include "serve/cli-args.hpp"
#include "serve/config-error.hpp"
#include "serve/config-file.hpp"
#include "serve/effective-config.hpp"
#include "serve/log.hpp"
#include "serve/temp-file.hpp"

namespace serve {

namespace {

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

std::filesystem::path Canonical(const std::filesystem::path& path) { return std::filesystem::weakly_canonical(path); }

}  // namespace

class ConfigResolverTest : public ::testing::Test {
 protected:
  ConfigResolverTest() {
    www = tmpDir.createDir("www");
    tmpDir.writeFile("www/index.html", "<h1>home</h1>");
    notFoundPage = tmpDir.writeFile("www/404.html", "missing");
    cert = tmpDir.writeFile("tls/cert.pem", "cert");
    key = tmpDir.writeFile("tls/key.pem", "key");
    configPath = tmpDir.dirPath() / "serve.toml";
  }

  ConfigError::Kind resolveErrorKind(const CliArgs& cliArgs) {
    try {
      ResolveConfig(cliArgs);
    } catch (const ConfigError& err) {
      return err.kind();
    }
    ADD_FAILURE() << "expected a ConfigError";
    return ConfigError::Kind::InvalidValue;
  }

  test::ScopedTempDir tmpDir;
  std::filesystem::path www;
  std::filesystem::path notFoundPage;
  std::filesystem::path cert;
  std::filesystem::path key;
  std::filesystem::path configPath;
};

TEST(MergeTest, Precedence) {
  EXPECT_EQ(Merge(std::optional<int>(1), std::optional<int>(2), 3), 1);
  EXPECT_EQ(Merge(std::optional<int>(), std::optional<int>(2), 3), 2);
  EXPECT_EQ(Merge(std::optional<int>(), std::optional<int>(), 3), 3);
  EXPECT_EQ(Merge(std::optional<int>(), std::optional<int>(2)), 2);
  EXPECT_FALSE(Merge(std::optional<int>(), std::optional<int>()));
}

TEST_F(ConfigResolverTest, DefaultsWithoutConfigFile) {
  CliArgs cliArgs;
  cliArgs.path = www;
  const auto resolved = ResolveConfig(cliArgs);
  ASSERT_TRUE(resolved.config);
  const EffectiveConfig& config = *resolved.config;
  EXPECT_EQ(config.path, Canonical(www));
  EXPECT_EQ(config.addr, "127.0.0.1");
  EXPECT_EQ(config.port, 3000);
  EXPECT_TRUE(config.compressionEnabled);
  EXPECT_FALSE(config.notFound);
  EXPECT_FALSE(config.okOverride);
  EXPECT_EQ(config.logLevel, log::level::err);
  EXPECT_FALSE(config.logPath);
  EXPECT_EQ(config.logMaxFiles, 7U);
  EXPECT_FALSE(config.tls);
  EXPECT_FALSE(resolved.configPath);
  EXPECT_FALSE(resolved.configFileCreated);
}

TEST_F(ConfigResolverTest, CommandLineOverridesFileFieldByField) {
  ConfigFile configFile;
  configFile.path = www;
  configFile.port = 8080;
  configFile.addr = "0.0.0.0";
  configFile.disableCompression = true;
  configFile.logLevel = log::level::debug;
  configFile.logMaxFiles = 3;
  configFile.save(configPath);

  CliArgs cliArgs;
  cliArgs.config = configPath;
  cliArgs.port = 9090;
  cliArgs.verbose = 1;
  const auto resolved = ResolveConfig(cliArgs);
  const EffectiveConfig& config = *resolved.config;
  EXPECT_EQ(config.port, 9090);
  EXPECT_EQ(config.addr, "0.0.0.0");
  EXPECT_FALSE(config.compressionEnabled);
  EXPECT_EQ(config.logLevel, log::level::warn);
  EXPECT_EQ(config.logMaxFiles, 3U);
  EXPECT_EQ(config.path, Canonical(www));
  EXPECT_FALSE(resolved.configFileCreated);
  EXPECT_EQ(resolved.configPath, Canonical(configPath));
}

TEST_F(ConfigResolverTest, TlsSettingsMergedFromBothSources) {
  ConfigFile configFile;
  configFile.path = www;
  configFile.tls.emplace();
  configFile.tls->cert = cert;
  configFile.tls->key = tmpDir.dirPath() / "old.key";
  configFile.tls->redirectHttp = true;
  configFile.save(configPath);

  CliArgs cliArgs;
  cliArgs.config = configPath;
  cliArgs.tls.emplace();
  cliArgs.tls->key = key;
  const auto resolved = ResolveConfig(cliArgs);
  ASSERT_TRUE(resolved.config->tls);
  EXPECT_EQ(resolved.config->tls->cert, Canonical(cert));
  EXPECT_EQ(resolved.config->tls->key, Canonical(key));
  EXPECT_TRUE(resolved.config->tls->redirectHttp);
}

TEST_F(ConfigResolverTest, MissingConfigFileIsWrittenWithResolvedValues) {
  CliArgs cliArgs;
  cliArgs.config = configPath;
  cliArgs.path = www;
  cliArgs.port = 8081;
  cliArgs.notFound = notFoundPage;
  cliArgs.ok = true;
  const auto resolved = ResolveConfig(cliArgs);
  EXPECT_TRUE(resolved.configFileCreated);
  ASSERT_TRUE(std::filesystem::is_regular_file(configPath));
  EXPECT_TRUE(ReadAll(configPath).starts_with("# Configuration for serve"));

  const auto written = ConfigFile::Load(configPath);
  EXPECT_EQ(written, ToConfigFile(*resolved.config));
  EXPECT_EQ(written.port, 8081);
  EXPECT_EQ(written.path, Canonical(www));
  EXPECT_EQ(written.notFound, Canonical(notFoundPage));
  EXPECT_EQ(written.ok, true);
}

TEST_F(ConfigResolverTest, WrittenConfigFileAloneReproducesConfiguration) {
  CliArgs first;
  first.config = configPath;
  first.path = www;
  first.addr = "0.0.0.0";
  first.disableCompression = true;
  first.verbose = 2;
  first.tls.emplace();
  first.tls->cert = cert;
  first.tls->key = key;
  const auto firstResolved = ResolveConfig(first);
  ASSERT_TRUE(firstResolved.configFileCreated);

  CliArgs second;
  second.config = configPath;
  const auto secondResolved = ResolveConfig(second);
  EXPECT_FALSE(secondResolved.configFileCreated);
  EXPECT_EQ(*secondResolved.config, *firstResolved.config);
}

TEST_F(ConfigResolverTest, ExistingConfigFileIsNeverRewritten) {
  tmpDir.writeFile("serve.toml", "port = 4000\n");
  CliArgs cliArgs;
  cliArgs.config = configPath;
  cliArgs.path = www;
  cliArgs.port = 5000;
  const auto resolved = ResolveConfig(cliArgs);
  EXPECT_EQ(resolved.config->port, 5000);
  EXPECT_EQ(ReadAll(configPath), "port = 4000\n");
}

TEST_F(ConfigResolverTest, InvalidConfigurationIsNotPersisted) {
  CliArgs cliArgs;
  cliArgs.config = configPath;
  cliArgs.path = tmpDir.dirPath() / "nope";
  EXPECT_THROW(ResolveConfig(cliArgs), ConfigError);
  EXPECT_FALSE(std::filesystem::exists(configPath));
}

TEST_F(ConfigResolverTest, OkWithoutNotFoundFromFile) {
  tmpDir.writeFile("serve.toml", "ok = true\n");
  CliArgs cliArgs;
  cliArgs.config = configPath;
  cliArgs.path = www;
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::InvalidCombination);
}

TEST_F(ConfigResolverTest, IncompleteTls) {
  CliArgs cliArgs;
  cliArgs.path = www;
  cliArgs.tls.emplace();
  cliArgs.tls->cert = cert;
  try {
    ResolveConfig(cliArgs);
    FAIL() << "expected a ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err.kind(), ConfigError::Kind::IncompleteTls);
    EXPECT_EQ(err.field(), "tls.key");
  }

  cliArgs.tls->cert.reset();
  cliArgs.tls->key = key;
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::IncompleteTls);
}

TEST_F(ConfigResolverTest, MissingPaths) {
  CliArgs cliArgs;
  cliArgs.path = tmpDir.dirPath() / "missing-dir";
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::PathNotFound);

  cliArgs.path = www;
  cliArgs.notFound = tmpDir.dirPath() / "missing.html";
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::PathNotFound);

  cliArgs.notFound.reset();
  cliArgs.tls.emplace();
  cliArgs.tls->cert = cert;
  cliArgs.tls->key = tmpDir.dirPath() / "missing.key";
  try {
    ResolveConfig(cliArgs);
    FAIL() << "expected a ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err.kind(), ConfigError::Kind::PathNotFound);
    EXPECT_EQ(err.field(), "tls.key");
  }
}

TEST_F(ConfigResolverTest, NotADirectory) {
  CliArgs cliArgs;
  cliArgs.path = notFoundPage;
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::NotADirectory);

  cliArgs.path = www;
  cliArgs.logPath = notFoundPage;
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::NotADirectory);
}

TEST_F(ConfigResolverTest, MissingLogDirectoryIsAccepted) {
  CliArgs cliArgs;
  cliArgs.path = www;
  cliArgs.logPath = tmpDir.dirPath() / "logs";
  const auto resolved = ResolveConfig(cliArgs);
  EXPECT_EQ(resolved.config->logPath, Canonical(tmpDir.dirPath() / "logs"));
}

TEST_F(ConfigResolverTest, InvalidValues) {
  CliArgs cliArgs;
  cliArgs.path = www;
  cliArgs.addr = "localhost";
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::InvalidValue);

  cliArgs.addr = "::1";
  EXPECT_NO_THROW(ResolveConfig(cliArgs));

  cliArgs.logPath = tmpDir.dirPath() / "logs";
  cliArgs.logMaxFiles = 70000;
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::InvalidValue);
}

TEST_F(ConfigResolverTest, MalformedConfigFile) {
  tmpDir.writeFile("serve.toml", "port = [\n");
  CliArgs cliArgs;
  cliArgs.config = configPath;
  cliArgs.path = www;
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::ParseFailure);
}

TEST_F(ConfigResolverTest, ConfigPathIsADirectory) {
  CliArgs cliArgs;
  cliArgs.config = www;
  cliArgs.path = www;
  EXPECT_EQ(resolveErrorKind(cliArgs), ConfigError::Kind::PathNotFound);
}

}  // namespace serve
