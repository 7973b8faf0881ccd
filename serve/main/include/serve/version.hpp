#pragma once

#include <string_view>

#ifndef SERVE_VERSION_STR
#error "SERVE_VERSION_STR must be defined via build system"
#endif

namespace serve {

// Semver of the project as injected by the build system.
constexpr std::string_view version() { return SERVE_VERSION_STR; }

// Multi-line description of the version and of the libraries compiled in, for --version.
std::string_view fullVersionString();

}  // namespace serve
