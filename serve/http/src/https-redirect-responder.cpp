#include "serve/https-redirect-responder.hpp"

#include <string>
#include <string_view>

#include "serve/http-constants.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/http-status-code.hpp"
#include "serve/log.hpp"

namespace serve {

std::string HttpsAuthority(std::string_view host) {
  // The port separator is the last ':' outside of an IPv6 literal ('[::1]:80').
  const auto colonPos = host.rfind(':');
  const auto closingBracketPos = host.rfind(']');
  const bool hasPort =
      colonPos != std::string_view::npos && (closingBracketPos == std::string_view::npos || colonPos > closingBracketPos);
  if (hasPort && host.substr(colonPos + 1) == "80") {
    std::string authority(host.substr(0, colonPos + 1));
    authority.append("443");
    return authority;
  }
  return std::string(host);
}

HttpResponse RedirectToHttps(const HttpRequest& request) {
  const auto host = request.headerValue(http::Host);
  if (!host || host->empty()) {
    log::error("Unable to redirect '{}' to HTTPS: missing Host header", request.target());
    return HttpResponse(http::StatusCodeBadRequest);
  }

  std::string location("https://");
  location.append(HttpsAuthority(*host));

  const std::string_view target = request.target();
  location.append(target.empty() ? "/" : target);

  HttpResponse resp(http::StatusCodePermanentRedirect);
  resp.addHeader(http::Location, location);
  return resp;
}

}  // namespace serve
