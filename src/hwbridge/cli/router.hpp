#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hwbridge::cli {

// Options of `hwbridge serve`. Command-line overrides are applied on top of
// the config file and re-validated.
struct ServeOptions {
  std::string config_path = "config.json";
  std::optional<core::logging::LogLevel> log_level;
  std::optional<std::uint16_t> port;
};

struct CallOptions {
  std::string method;
  std::string params_json = "{}";
  std::string url = "ws://localhost:8443";
  std::chrono::milliseconds timeout{30000};
};

// Routes `hwbridge` subcommands and returns process exit codes with a stable
// contract for service managers and scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file invalid
//   20 => gateway failed to start (port bind, queue store)
//   30 => `call` got an RPC error or could not reach the gateway
int Dispatch(int argc, char** argv);

} // namespace hwbridge::cli
