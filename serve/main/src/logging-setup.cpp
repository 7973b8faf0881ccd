#include "serve/logging-setup.hpp"

#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "serve/effective-config.hpp"
#include "serve/log-level.hpp"
#include "serve/log.hpp"

namespace serve {

namespace {
constexpr std::string_view kLoggerName = "serve";
}  // namespace

void SetupLogging(const EffectiveConfig& config) {
  std::shared_ptr<log::logger> logger;
  if (config.logPath) {
    std::filesystem::create_directories(*config.logPath);
    const std::string fileNamePattern = (*config.logPath / kLogFilePattern).string();
    auto sink = std::make_shared<log::sinks::daily_file_format_sink_mt>(fileNamePattern, 0, 0, false,
                                                                        static_cast<uint16_t>(config.logMaxFiles));
    logger = std::make_shared<log::logger>(std::string(kLoggerName), std::move(sink));
  } else {
    logger = std::make_shared<log::logger>(std::string(kLoggerName),
                                           std::make_shared<log::sinks::stdout_color_sink_mt>());
  }
  logger->set_level(config.logLevel);
  // Access lines are written as soon as the response is sent.
  logger->flush_on(log::level::info);
  log::set_default_logger(std::move(logger));

  if (config.logPath) {
    log::info("Logging to {} (keeping {} files)", config.logPath->string(), config.logMaxFiles);
  }
}

}  // namespace serve
