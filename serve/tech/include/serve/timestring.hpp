#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "serve/timedef.hpp"

namespace serve {

inline constexpr std::size_t kRFC7231DateStrLen = 29;
inline constexpr SysTimePoint kInvalidTimePoint = SysTimePoint::max();

/// Format a time point to an RFC7231 IMF-fixdate string (e.g. "Sun, 06 Nov 1994 08:49:37 GMT").
/// Buffer must have space for at least kRFC7231DateStrLen characters (no null terminator added).
/// Returns pointer past last written char.
char* TimeToStringRFC7231(SysTimePoint tp, char* out);

inline std::string TimeToStringRFC7231(SysTimePoint tp) {
  std::string ret(kRFC7231DateStrLen, '\0');
  TimeToStringRFC7231(tp, ret.data());
  return ret;
}

// Parse a string representation of a given time point in RFC7231 IMF-fixdate format.
// If parsing fails, returns kInvalidTimePoint.
SysTimePoint TryParseTimeRFC7231(std::string_view value);

}  // namespace serve
