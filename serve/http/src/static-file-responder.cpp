#include "serve/static-file-responder.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include "serve/file.hpp"
#include "serve/http-constants.hpp"
#include "serve/http-method.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/http-status-code.hpp"
#include "serve/log.hpp"
#include "serve/mime-mappings.hpp"
#include "serve/serving-policy.hpp"
#include "serve/string-helpers.hpp"
#include "serve/timedef.hpp"
#include "serve/timestring.hpp"

namespace serve {

namespace {

[[nodiscard]] std::string MakeStrongEtag(std::uint64_t fileSize, SysTimePoint lastModified) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(lastModified.time_since_epoch()).count();
  return std::format("\"{:x}-{:x}\"", fileSize, static_cast<std::uint64_t>(nanos));
}

struct RangeSelection {
  enum class State : std::uint8_t { None, Valid, Unsatisfiable };

  State state{State::None};
  std::uint64_t offset{0};
  std::uint64_t length{0};
};

inline constexpr std::uint64_t kInvalidUint64 = std::numeric_limits<std::uint64_t>::max();

[[nodiscard]] std::uint64_t ParseUint(std::string_view token) {
  token = TrimOws(token);
  if (token.empty()) {
    return kInvalidUint64;
  }
  std::uint64_t value;
  const auto first = token.data();
  const auto last = token.data() + token.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return kInvalidUint64;
  }
  return value;
}

// Only single-range requests are honored (e.g. "Range: bytes=N-M"). Multi-range and syntactically invalid
// Range headers are ignored and the full representation is sent.
[[nodiscard]] RangeSelection ParseRange(std::string_view raw, std::uint64_t fileSize) {
  RangeSelection result;
  raw = TrimOws(raw);
  static constexpr std::string_view kBytesEqual = "bytes=";
  if (!StartsWithCaseInsensitive(raw, kBytesEqual)) {
    return result;
  }
  raw = TrimOws(raw.substr(kBytesEqual.size()));
  if (raw.empty() || raw.contains(',')) {
    return result;
  }
  const auto dashPos = raw.find('-');
  if (dashPos == std::string_view::npos) {
    return result;
  }
  const auto firstPart = TrimOws(raw.substr(0, dashPos));
  const auto secondPart = TrimOws(raw.substr(dashPos + 1));

  if (firstPart.empty()) {
    // suffix-byte-range-spec: bytes=-N (last N bytes)
    const auto suffixLen = ParseUint(secondPart);
    if (suffixLen == kInvalidUint64) {
      return result;
    }
    if (suffixLen == 0 || fileSize == 0) {
      result.state = RangeSelection::State::Unsatisfiable;
      return result;
    }
    const std::uint64_t len = std::min<std::uint64_t>(suffixLen, fileSize);
    result.offset = fileSize - len;
    result.length = len;
    result.state = RangeSelection::State::Valid;
    return result;
  }

  const auto firstValue = ParseUint(firstPart);
  if (firstValue == kInvalidUint64) {
    return result;
  }
  std::uint64_t secondValue = kInvalidUint64;
  if (!secondPart.empty()) {
    secondValue = ParseUint(secondPart);
    if (secondValue == kInvalidUint64 || secondValue < firstValue) {
      return result;
    }
  }
  if (firstValue >= fileSize) {
    result.state = RangeSelection::State::Unsatisfiable;
    return result;
  }
  const std::uint64_t endInclusive = std::min<std::uint64_t>(secondValue, fileSize - 1);
  result.offset = firstValue;
  result.length = endInclusive - firstValue + 1;
  result.state = RangeSelection::State::Valid;
  return result;
}

// Strong comparison: weak validators never match our strong ETags.
[[nodiscard]] bool EtagListMatches(std::string_view headerValue, std::string_view etag) {
  while (!headerValue.empty()) {
    const auto commaPos = headerValue.find(',');
    const auto token = TrimOws(headerValue.substr(0, commaPos));
    if (token == "*" || token == etag) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    headerValue.remove_prefix(commaPos + 1);
  }
  return false;
}

struct ConditionalOutcome {
  enum class Kind : std::uint8_t { None, NotModified, PreconditionFailed };

  Kind kind{Kind::None};
  bool rangeAllowed{true};
};

[[nodiscard]] ConditionalOutcome EvaluateConditionals(const HttpRequest& request, std::string_view etag,
                                                      SysTimePoint lastModified) {
  ConditionalOutcome outcome;

  if (auto ifMatch = request.headerValue("If-Match"); ifMatch.has_value()) {
    if (!EtagListMatches(*ifMatch, etag)) {
      outcome.kind = ConditionalOutcome::Kind::PreconditionFailed;
      outcome.rangeAllowed = false;
      return outcome;
    }
  } else if (auto ifUnmodified = request.headerValue("If-Unmodified-Since"); ifUnmodified.has_value()) {
    const auto parsed = TryParseTimeRFC7231(*ifUnmodified);
    if (parsed != kInvalidTimePoint && std::chrono::floor<std::chrono::seconds>(lastModified) > parsed) {
      outcome.kind = ConditionalOutcome::Kind::PreconditionFailed;
      outcome.rangeAllowed = false;
      return outcome;
    }
  }

  // If-None-Match takes precedence over If-Modified-Since (RFC 9110 section 13.2.2).
  if (auto ifNoneMatch = request.headerValue(http::IfNoneMatch); ifNoneMatch.has_value()) {
    if (EtagListMatches(*ifNoneMatch, etag)) {
      outcome.kind = ConditionalOutcome::Kind::NotModified;
      outcome.rangeAllowed = false;
    }
    return outcome;
  }

  if (auto ifModified = request.headerValue(http::IfModifiedSince); ifModified.has_value()) {
    const auto parsed = TryParseTimeRFC7231(*ifModified);
    // HTTP dates have a one second resolution.
    if (parsed != kInvalidTimePoint && std::chrono::floor<std::chrono::seconds>(lastModified) <= parsed) {
      outcome.kind = ConditionalOutcome::Kind::NotModified;
      outcome.rangeAllowed = false;
    }
  }

  return outcome;
}

[[nodiscard]] bool IfRangeAllowsPartial(std::string_view value, std::string_view etag, SysTimePoint lastModified) {
  value = TrimOws(value);
  if (value.empty() || value.starts_with("W/")) {
    return false;
  }
  if (value.front() == '"') {
    return value == etag;
  }
  const auto parsed = TryParseTimeRFC7231(value);
  return parsed != kInvalidTimePoint && std::chrono::floor<std::chrono::seconds>(lastModified) <= parsed;
}

void AddValidators(HttpResponse& resp, std::string_view etag, SysTimePoint lastModified) {
  resp.addHeader(http::ETag, etag);
  resp.addHeader(http::LastModified, TimeToStringRFC7231(lastModified));
}

HttpResponse MakeError(http::StatusCode code) {
  HttpResponse resp(code);
  std::string body(http::ReasonPhrase(code));
  body.push_back('\n');
  resp.body(std::move(body));
  return resp;
}

}  // namespace

HttpResponse StaticFileResponder::respond(const HttpRequest& request) const {
  if (request.method() != http::Method::GET && request.method() != http::Method::HEAD) {
    HttpResponse resp = MakeError(http::StatusCodeMethodNotAllowed);
    resp.addHeader(http::Allow, "GET, HEAD");
    return resp;
  }

  Disposition decision;
  try {
    decision = _policy.decide(request.path());
  } catch (const ServingError& ex) {
    log::warn("Rejected request path '{}': {}", request.path(), ex.what());
    return MakeError(ex.kind() == ServingError::Kind::OutOfRoot ? http::StatusCodeForbidden
                                                                : http::StatusCodeBadRequest);
  }

  return std::visit(
      [this, &request](const auto& value) -> HttpResponse {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, disposition::Serve>) {
          return serveFile(request, value.path);
        } else if constexpr (std::is_same_v<T, disposition::NotFoundEmpty>) {
          return HttpResponse(http::StatusCodeNotFound);
        } else if constexpr (std::is_same_v<T, disposition::NotFoundWithBody>) {
          return FallbackBody(http::StatusCodeNotFound, value.path);
        } else if constexpr (std::is_same_v<T, disposition::OkOverride>) {
          return FallbackBody(http::StatusCodeOK, value.path);
        } else {
          static_assert(std::is_same_v<T, disposition::RedirectToDirectory>);
          HttpResponse resp(http::StatusCodeTemporaryRedirect);
          resp.addHeader(http::Location, value.location);
          return resp;
        }
      },
      decision);
}

HttpResponse StaticFileResponder::serveFile(const HttpRequest& request, const std::filesystem::path& filePath) const {
  File file(filePath.string());
  if (!file) {
    // Removed or made unreadable since the policy decision.
    return HttpResponse(http::StatusCodeNotFound);
  }

  const std::uint64_t fileSize = file.size();
  const SysTimePoint lastModified = file.lastModified();
  const std::string etag = MakeStrongEtag(fileSize, lastModified);

  const auto conditionalOutcome = EvaluateConditionals(request, etag, lastModified);
  if (conditionalOutcome.kind == ConditionalOutcome::Kind::PreconditionFailed) {
    HttpResponse resp = MakeError(http::StatusCodePreconditionFailed);
    AddValidators(resp, etag, lastModified);
    return resp;
  }
  if (conditionalOutcome.kind == ConditionalOutcome::Kind::NotModified) {
    HttpResponse resp(http::StatusCodeNotModified);
    AddValidators(resp, etag, lastModified);
    resp.addHeader(http::AcceptRanges, http::bytes);
    return resp;
  }

  RangeSelection rangeSelection;
  if (conditionalOutcome.rangeAllowed) {
    if (auto rangeHeader = request.headerValue(http::Range); rangeHeader.has_value()) {
      bool allowed = true;
      if (auto ifRange = request.headerValue(http::IfRange); ifRange.has_value()) {
        allowed = IfRangeAllowsPartial(*ifRange, etag, lastModified);
      }
      if (allowed) {
        rangeSelection = ParseRange(*rangeHeader, fileSize);
      }
    }
  }

  if (rangeSelection.state == RangeSelection::State::Unsatisfiable) {
    HttpResponse resp = MakeError(http::StatusCodeRangeNotSatisfiable);
    resp.addHeader(http::ContentRange, std::format("bytes */{}", fileSize));
    resp.addHeader(http::AcceptRanges, http::bytes);
    return resp;
  }

  HttpResponse resp(http::StatusCodeOK);
  resp.addHeader(http::ContentType, DetermineMIMETypeStr(filePath.native()));
  resp.addHeader(http::AcceptRanges, http::bytes);
  AddValidators(resp, etag, lastModified);

  if (rangeSelection.state == RangeSelection::State::Valid) {
    resp.status(http::StatusCodePartialContent);
    resp.addHeader(http::ContentRange,
                   std::format("bytes {}-{}/{}", rangeSelection.offset,
                               rangeSelection.offset + rangeSelection.length - 1, fileSize));
    resp.file(std::move(file), static_cast<std::size_t>(rangeSelection.offset),
              static_cast<std::size_t>(rangeSelection.length));
    return resp;
  }

  resp.file(std::move(file));
  return resp;
}

HttpResponse StaticFileResponder::FallbackBody(http::StatusCode statusCode, const std::filesystem::path& filePath) {
  File file(filePath.string());
  if (!file) {
    log::error("Unable to open fallback file '{}'", filePath.string());
    return HttpResponse(http::StatusCodeNotFound);
  }
  HttpResponse resp(statusCode);
  resp.addHeader(http::ContentType, DetermineMIMETypeStr(filePath.native()));
  resp.file(std::move(file));
  return resp;
}

}  // namespace serve
