#include "serve/timestring.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "serve/timedef.hpp"

namespace serve {

namespace {

constexpr std::string_view kWeekdays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
constexpr std::string_view kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

char* Write2(char* out, unsigned value) {
  *out++ = static_cast<char>('0' + ((value / 10U) % 10U));
  *out++ = static_cast<char>('0' + (value % 10U));
  return out;
}

char* Copy3(char* out, std::string_view str) { return std::copy_n(str.data(), 3, out); }

// Parses exactly 'nbDigits' decimal digits at 'pos'. Returns -1 on failure.
int ParseDigits(std::string_view str, std::size_t pos, std::size_t nbDigits) {
  int value = 0;
  for (std::size_t idx = pos; idx < pos + nbDigits; ++idx) {
    const char ch = str[idx];
    if (ch < '0' || ch > '9') {
      return -1;
    }
    value = (value * 10) + (ch - '0');
  }
  return value;
}

}  // namespace

char* TimeToStringRFC7231(SysTimePoint tp, char* out) {
  using namespace std::chrono;
  const sys_seconds secTp = time_point_cast<seconds>(tp);
  const auto dayPoint = floor<days>(secTp);
  const year_month_day ymd{dayPoint};
  const weekday wd{dayPoint};
  const hh_mm_ss hms{secTp - dayPoint};
  const int year = static_cast<int>(ymd.year());

  out = Copy3(out, kWeekdays[wd.c_encoding()]);
  *out++ = ',';
  *out++ = ' ';
  out = Write2(out, static_cast<unsigned>(ymd.day()));
  *out++ = ' ';
  out = Copy3(out, kMonths[static_cast<unsigned>(ymd.month()) - 1U]);
  *out++ = ' ';
  out = Write2(out, static_cast<unsigned>(year / 100));
  out = Write2(out, static_cast<unsigned>(year % 100));
  *out++ = ' ';
  out = Write2(out, static_cast<unsigned>(hms.hours().count()));
  *out++ = ':';
  out = Write2(out, static_cast<unsigned>(hms.minutes().count()));
  *out++ = ':';
  out = Write2(out, static_cast<unsigned>(hms.seconds().count()));
  *out++ = ' ';
  return Copy3(out, "GMT");
}

SysTimePoint TryParseTimeRFC7231(std::string_view value) {
  // WWW, DD Mon YYYY HH:MM:SS GMT
  // 0123456789012345678901234567
  if (value.size() != kRFC7231DateStrLen || value[3] != ',' || value[4] != ' ' || value[7] != ' ' ||
      value[11] != ' ' || value[16] != ' ' || value[19] != ':' || value[22] != ':' || value[25] != ' ' ||
      value.substr(26) != "GMT") {
    return kInvalidTimePoint;
  }
  if (std::ranges::find(kWeekdays, value.substr(0, 3)) == std::end(kWeekdays)) {
    return kInvalidTimePoint;
  }
  const auto monthIt = std::ranges::find(kMonths, value.substr(8, 3));
  if (monthIt == std::end(kMonths)) {
    return kInvalidTimePoint;
  }
  const int day = ParseDigits(value, 5, 2);
  const int year = ParseDigits(value, 12, 4);
  const int hour = ParseDigits(value, 17, 2);
  const int minute = ParseDigits(value, 20, 2);
  const int second = ParseDigits(value, 23, 2);
  if (day < 0 || year < 0 || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
    return kInvalidTimePoint;
  }

  using namespace std::chrono;
  const year_month_day ymd{std::chrono::year{year},
                           std::chrono::month{static_cast<unsigned>(std::distance(std::begin(kMonths), monthIt) + 1)},
                           std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    return kInvalidTimePoint;
  }
  return sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
}

}  // namespace serve
