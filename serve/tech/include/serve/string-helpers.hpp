#pragma once

#include <string_view>

#include "serve/toupperlower.hpp"

namespace serve {

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
    sv.remove_suffix(1);
  }
  return sv;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) noexcept {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Returns true if the comma separated header value 'list' contains 'token' (case insensitive, OWS trimmed).
constexpr bool HeaderListContains(std::string_view list, std::string_view token) noexcept {
  while (!list.empty()) {
    const auto commaPos = list.find(',');
    if (CaseInsensitiveEqual(TrimOws(list.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace serve
