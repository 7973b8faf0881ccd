#pragma once

#include <string>
#include <string_view>

#include "serve/http-request.hpp"
#include "serve/http-response.hpp"

namespace serve {

// 'host' (a Host header value) with an explicit port 80 changed to 443. The host name itself is kept as is.
std::string HttpsAuthority(std::string_view host);

// Answers requests received on the plain HTTP port 80 when HTTPS runs on 443:
// 308 to 'https://<HttpsAuthority(host)><target>', or 400 when the Host header is missing.
HttpResponse RedirectToHttps(const HttpRequest& request);

}  // namespace serve
