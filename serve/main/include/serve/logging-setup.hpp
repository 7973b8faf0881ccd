#pragma once

#include <string_view>

#include "serve/effective-config.hpp"

namespace serve {

// strftime pattern of the log files written under 'log_path'.
inline constexpr std::string_view kLogFilePattern = "serve.%Y-%m-%d.log";

// Applies the log level and destination of 'config' to the default logger:
//  - no log path: colored stdout logger
//  - log path: files 'serve.YYYY-MM-DD.log' in that directory (created if missing), rotated at midnight,
//    keeping 'log_max_files' of them.
// Throws std::filesystem::filesystem_error if the directory cannot be created, spdlog::spdlog_ex if the file
// cannot be opened.
void SetupLogging(const EffectiveConfig& config);

}  // namespace serve
