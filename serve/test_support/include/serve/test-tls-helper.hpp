#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "serve/temp-file.hpp"

namespace serve::test {

// Generates an ephemeral self-signed RSA certificate entirely in memory.
// Returns {certPem, keyPem}. Intended ONLY for tests: 2048-bit RSA, 1h validity by default.
std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName = "localhost",
                                                         int validSeconds = 3600);

struct CertKeyFiles {
  std::filesystem::path cert;
  std::filesystem::path key;
};

// Writes a fresh ephemeral certificate and key as '<name>.crt' / '<name>.key' inside 'dir'.
CertKeyFiles WriteEphemeralCertKey(const ScopedTempDir& dir, std::string_view name = "server");

}  // namespace serve::test
