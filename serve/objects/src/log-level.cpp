#include "serve/log-level.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

#include "serve/string-helpers.hpp"

namespace serve {

namespace {

struct LevelName {
  LogLevel level;
  std::string_view name;
};

// From least to most verbose. 'critical' has no name of its own, it is reported as 'error'.
constexpr std::array kVerbosityScale = {
    LevelName{log::level::off, "off"},     LevelName{log::level::err, "error"},
    LevelName{log::level::warn, "warn"},   LevelName{log::level::info, "info"},
    LevelName{log::level::debug, "debug"}, LevelName{log::level::trace, "trace"},
};

std::size_t ScalePosition(LogLevel level) noexcept {
  if (level == log::level::critical) {
    level = log::level::err;
  }
  const auto it = std::ranges::find(kVerbosityScale, level, &LevelName::level);
  return it == kVerbosityScale.end() ? 1U : static_cast<std::size_t>(std::distance(kVerbosityScale.begin(), it));
}

}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept {
  const auto it = std::ranges::find_if(
      kVerbosityScale, [name](const LevelName& levelName) { return CaseInsensitiveEqual(levelName.name, name); });
  if (it == kVerbosityScale.end()) {
    return std::nullopt;
  }
  return it->level;
}

std::string_view LogLevelName(LogLevel level) noexcept { return kVerbosityScale[ScalePosition(level)].name; }

LogLevel ShiftVerbosity(LogLevel base, int delta) noexcept {
  const int pos = std::clamp(static_cast<int>(ScalePosition(base)) + delta, 0,
                             static_cast<int>(kVerbosityScale.size()) - 1);
  return kVerbosityScale[static_cast<std::size_t>(pos)].level;
}

}  // namespace serve
