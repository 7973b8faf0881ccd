#pragma once

#include <openssl/ssl.h>

#include <memory>

namespace serve {

// Function pointer deleters keep type size = one pointer + deleter.
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;

}  // namespace serve
