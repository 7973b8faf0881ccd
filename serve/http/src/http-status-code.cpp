#include "serve/http-status-code.hpp"

#include <string_view>

namespace serve::http {

std::string_view ReasonPhrase(StatusCode statusCode) noexcept {
  switch (statusCode) {
    case StatusCodeOK:
      return "OK";
    case StatusCodePartialContent:
      return "Partial Content";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeTemporaryRedirect:
      return "Temporary Redirect";
    case StatusCodePermanentRedirect:
      return "Permanent Redirect";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeNotAcceptable:
      return "Not Acceptable";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodePreconditionFailed:
      return "Precondition Failed";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeURITooLong:
      return "URI Too Long";
    case StatusCodeRangeNotSatisfiable:
      return "Range Not Satisfiable";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return {};
  }
}

}  // namespace serve::http
