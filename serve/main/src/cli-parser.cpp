#include "serve/cli-parser.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "serve/cli-args.hpp"

namespace serve {

namespace {

constexpr std::string_view kMainUsage = R"(A local static file server with optional TLS

Usage: serve [OPTIONS] [COMMAND]

Commands:
  tls   Serve over HTTPS (see 'serve tls --help')

Options:
  -c, --config <FILE>          Configuration file, created from the other options if it does not exist
      --path <DIR>             Directory to serve [default: .]
  -p, --port <PORT>            Port to listen on [default: 3000]
  -a, --addr <ADDR>            IP address to bind [default: 127.0.0.1]
      --disable-compression    Never compress responses
      --not-found <FILE>       File sent as body of 404 responses
      --ok                     Answer 200 instead of 404 with the --not-found body (single page applications)
  -v, --verbose...             More logs, can be repeated
  -q, --quiet...               Less logs, can be repeated
      --log-path <DIR>         Write logs to daily rotated files in this directory instead of stdout
      --log-max-files <N>      Number of rotated log files to keep [default: 7]
  -h, --help                   Print help
  -V, --version                Print version
)";

constexpr std::string_view kTlsUsage = R"(Serve over HTTPS

Usage: serve [OPTIONS] tls [TLS OPTIONS]

TLS options:
  -c, --cert <FILE>     PEM certificate (chain)
  -k, --key <FILE>      PEM private key
      --redirect-http   Redirect plain HTTP requests on port 80 to HTTPS (only when listening on port 443)
  -h, --help            Print help
)";

// Walks the arguments, splitting '--name=value' and '-xVALUE' forms.
class ArgCursor {
 public:
  explicit ArgCursor(std::span<const char* const> args) : _args(args) {}

  [[nodiscard]] bool done() const noexcept { return _pos >= _args.size(); }

  // Current argument, advancing the cursor. For '--name=value' only the name part is returned and the value
  // is kept for the next call to value().
  std::string_view next() {
    std::string_view arg(_args[_pos++]);
    _inlineValue = {};
    _hasInlineValue = false;
    if (arg.starts_with("--")) {
      const auto eqPos = arg.find('=');
      if (eqPos != std::string_view::npos) {
        _inlineValue = arg.substr(eqPos + 1);
        _hasInlineValue = true;
        arg = arg.substr(0, eqPos);
      }
    }
    return arg;
  }

  // Value of the option 'name' just returned by next().
  std::string_view value(std::string_view name) {
    if (_hasInlineValue) {
      _hasInlineValue = false;
      return _inlineValue;
    }
    if (done()) {
      throw std::invalid_argument(std::format("a value is required for '{}' but none was supplied", name));
    }
    return _args[_pos++];
  }

  // Attaches a value glued to a short option ('-p8080').
  void setInlineValue(std::string_view value) noexcept {
    _inlineValue = value;
    _hasInlineValue = true;
  }

  // Throws if a flag (option without value) was given as '--flag=value'.
  void expectNoValue(std::string_view name) const {
    if (_hasInlineValue) {
      throw std::invalid_argument(std::format("unexpected value '{}' for '{}'", _inlineValue, name));
    }
  }

 private:
  std::span<const char* const> _args;
  std::size_t _pos{};
  std::string_view _inlineValue;
  bool _hasInlineValue{false};
};

template <class T>
T ParseNumber(std::string_view name, std::string_view value, std::string_view expected) {
  T result{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
  if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size()) {
    throw std::invalid_argument(std::format("invalid value '{}' for '{}': {}", value, name, expected));
  }
  return result;
}

std::filesystem::path ParsePath(std::string_view name, std::string_view value) {
  if (value.empty()) {
    throw std::invalid_argument(std::format("invalid value '' for '{}': expected a non empty path", name));
  }
  return {std::string(value)};
}

// Short options that take a value may carry it glued ('-p8080'). Repeated flags ('-vvq') are expanded.
// Returns the canonical option name to dispatch on, or an empty view if the argument was fully consumed.
std::string_view NormalizeShort(std::string_view arg, ArgCursor& cursor, std::string_view shortWithValue,
                                CliArgs* pVerbosity) {
  if (arg.size() <= 2 || arg.starts_with("--") || !arg.starts_with('-')) {
    return arg;
  }
  const char letter = arg[1];
  if (shortWithValue.contains(letter)) {
    cursor.setInlineValue(arg.substr(2));
    return arg.substr(0, 2);
  }
  if (pVerbosity != nullptr && arg.substr(1).find_first_not_of("vq") == std::string_view::npos) {
    for (char flag : arg.substr(1)) {
      ++(flag == 'v' ? pVerbosity->verbose : pVerbosity->quiet);
    }
    return {};
  }
  throw std::invalid_argument(std::format("unexpected argument '{}'", arg));
}

// Returns true if help was requested.
bool ParseTlsArgs(ArgCursor& cursor, CliArgs::Tls& tls) {
  while (!cursor.done()) {
    const std::string_view arg = NormalizeShort(cursor.next(), cursor, "ck", nullptr);
    if (arg == "-h" || arg == "--help") {
      return true;
    }
    if (arg == "-c" || arg == "--cert") {
      tls.cert = ParsePath("--cert", cursor.value("--cert"));
    } else if (arg == "-k" || arg == "--key") {
      tls.key = ParsePath("--key", cursor.value("--key"));
    } else if (arg == "--redirect-http") {
      cursor.expectNoValue(arg);
      tls.redirectHttp = true;
    } else {
      throw std::invalid_argument(std::format("unexpected argument '{}' for 'tls'", arg));
    }
  }
  return false;
}

}  // namespace

std::string_view MainUsage() noexcept { return kMainUsage; }

std::string_view TlsUsage() noexcept { return kTlsUsage; }

CommandLine ParseCommandLine(std::span<const char* const> args) {
  CommandLine cmdLine;
  CliArgs& cli = cmdLine.args;
  ArgCursor cursor(args);

  while (!cursor.done()) {
    const std::string_view arg = NormalizeShort(cursor.next(), cursor, "cpa", &cli);
    if (arg.empty()) {
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      cmdLine.action = CommandLine::Action::Help;
      cmdLine.helpText = kMainUsage;
      return cmdLine;
    }
    if (arg == "-V" || arg == "--version") {
      cmdLine.action = CommandLine::Action::Version;
      return cmdLine;
    }
    if (arg == "-c" || arg == "--config") {
      cli.config = ParsePath("--config", cursor.value("--config"));
    } else if (arg == "--path") {
      cli.path = ParsePath(arg, cursor.value(arg));
    } else if (arg == "-p" || arg == "--port") {
      cli.port = ParseNumber<uint16_t>("--port", cursor.value("--port"), "expected a port between 0 and 65535");
    } else if (arg == "-a" || arg == "--addr") {
      cli.addr = std::string(cursor.value("--addr"));
    } else if (arg == "--disable-compression") {
      cursor.expectNoValue(arg);
      cli.disableCompression = true;
    } else if (arg == "--not-found") {
      cli.notFound = ParsePath(arg, cursor.value(arg));
    } else if (arg == "--ok") {
      cursor.expectNoValue(arg);
      cli.ok = true;
    } else if (arg == "-v" || arg == "--verbose") {
      cursor.expectNoValue(arg);
      ++cli.verbose;
    } else if (arg == "-q" || arg == "--quiet") {
      cursor.expectNoValue(arg);
      ++cli.quiet;
    } else if (arg == "--log-path") {
      cli.logPath = ParsePath(arg, cursor.value(arg));
    } else if (arg == "--log-max-files") {
      cli.logMaxFiles = ParseNumber<uint32_t>(arg, cursor.value(arg), "expected a non negative number");
    } else if (arg == "tls") {
      if (ParseTlsArgs(cursor, cli.tls.emplace())) {
        cmdLine.action = CommandLine::Action::Help;
        cmdLine.helpText = kTlsUsage;
        return cmdLine;
      }
    } else {
      throw std::invalid_argument(std::format("unexpected argument '{}'", arg));
    }
  }

  if (cli.ok && !cli.notFound) {
    throw std::invalid_argument("the argument '--ok' requires '--not-found'");
  }
  if (cli.logMaxFiles && !cli.logPath) {
    throw std::invalid_argument("the argument '--log-max-files' requires '--log-path'");
  }
  return cmdLine;
}

}  // namespace serve
