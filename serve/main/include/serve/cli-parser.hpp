#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "serve/cli-args.hpp"

namespace serve {

struct CommandLine {
  enum class Action : uint8_t { Run, Help, Version };

  Action action{Action::Run};
  // Usage text of the command (or subcommand) that requested help.
  std::string_view helpText;
  CliArgs args;
};

// Parses 'serve [OPTIONS] [tls OPTIONS]'. 'args' excludes the program name.
// Accepts '--opt value', '--opt=value', '-o value', '-ovalue' and repeated short flags ('-vv').
// Throws std::invalid_argument on usage errors (unknown option, missing or malformed value, '--ok' without
// '--not-found', '--log-max-files' without '--log-path').
CommandLine ParseCommandLine(std::span<const char* const> args);

std::string_view MainUsage() noexcept;

std::string_view TlsUsage() noexcept;

}  // namespace serve
