#include "serve/logging-setup.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "serve/effective-config.hpp"
#include "serve/log.hpp"
#include "serve/temp-file.hpp"

namespace serve {

class LoggingSetupTest : public ::testing::Test {
 protected:
  void TearDown() override {
    // Back to a stdout logger before the temporary directory is removed.
    SetupLogging(EffectiveConfig{});
  }

  test::ScopedTempDir tmpDir;
};

TEST_F(LoggingSetupTest, StdoutLoggerUsesConfiguredLevel) {
  EffectiveConfig config;
  config.logLevel = log::level::debug;
  SetupLogging(config);
  ASSERT_NE(log::default_logger(), nullptr);
  EXPECT_EQ(log::default_logger()->name(), "serve");
  EXPECT_EQ(log::get_level(), log::level::debug);
}

TEST_F(LoggingSetupTest, FileLoggerCreatesDirectoryAndDailyFile) {
  EffectiveConfig config;
  config.logLevel = log::level::info;
  config.logPath = tmpDir.dirPath() / "nested" / "logs";
  config.logMaxFiles = 2;
  SetupLogging(config);

  log::info("hello from the file logger");
  log::debug("filtered out");
  log::default_logger()->flush();

  ASSERT_TRUE(std::filesystem::is_directory(*config.logPath));
  std::vector<std::filesystem::path> logFiles;
  for (const auto& entry : std::filesystem::directory_iterator(*config.logPath)) {
    logFiles.push_back(entry.path());
  }
  ASSERT_EQ(logFiles.size(), 1U);
  const std::string fileName = logFiles.front().filename().string();
  EXPECT_TRUE(fileName.starts_with("serve."));
  EXPECT_TRUE(fileName.ends_with(".log"));
  EXPECT_EQ(fileName.size(), std::string_view("serve.YYYY-MM-DD.log").size());

  std::ifstream ifs(logFiles.front());
  const std::string content{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
  EXPECT_NE(content.find("hello from the file logger"), std::string::npos);
  EXPECT_EQ(content.find("filtered out"), std::string::npos);
}

}  // namespace serve
