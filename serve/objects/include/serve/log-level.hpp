#pragma once

#include <optional>
#include <string_view>

#include "serve/log.hpp"

namespace serve {

using LogLevel = log::level::level_enum;

inline constexpr LogLevel kDefaultLogLevel = log::level::err;

// Accepted names: trace, debug, info, warn, error, off (case insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept;

// Name as written in the configuration file.
std::string_view LogLevelName(LogLevel level) noexcept;

// Moves 'base' by 'delta' steps along off < error < warn < info < debug < trace, clamped at both ends.
// Positive values increase verbosity.
LogLevel ShiftVerbosity(LogLevel base, int delta) noexcept;

}  // namespace serve
