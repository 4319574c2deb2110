#include "hwbridge/cli/router.hpp"

#include "client/bridge_client.hpp"
#include "config/gateway_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/gateway_methods.hpp"
#include "services/gateway_services.hpp"
#include "transport/gateway_server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <charconv>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace hwbridge::cli {

namespace {

constexpr std::string_view kVersion = "1.0.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitStartupFailed = core::errors::ToInt(core::errors::ExitCode::kStartupFailed);
constexpr int kExitRpcCallFailed = core::errors::ToInt(core::errors::ExitCode::kRpcCallFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  hwbridge serve [--config <file>] [--log-level <debug|info|warn|error>] "
         "[--port <n>]\n"
      << "  hwbridge validate-config <file>\n"
      << "  hwbridge init-config <file>\n"
      << "  hwbridge call <method> [params-json] [--url <ws-url>] [--timeout-ms <n>]\n"
      << "  hwbridge version\n";
}

template <class Integer>
bool ParseUnsigned(std::string_view raw, Integer min_value, Integer max_value, Integer& out) {
  Integer parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    return false;
  }
  if (parsed < min_value || parsed > max_value) {
    return false;
  }
  out = parsed;
  return true;
}

void PrintIssues(const std::string& path, const config::ValidationReport& report) {
  std::cerr << "invalid config: " << path << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

bool ParseServeOptions(const std::vector<std::string_view>& args, ServeOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      options.config_path = std::string(args[++i]);
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[++i], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }
    if (token == "--port") {
      if (i + 1 >= args.size()) {
        error = "missing value for --port";
        return false;
      }
      std::uint16_t port = 0;
      if (!ParseUnsigned<std::uint16_t>(args[++i], 1, 65535, port)) {
        error = "--port must be an integer in 1..65535";
        return false;
      }
      options.port = port;
      continue;
    }
    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

bool ParseCallOptions(const std::vector<std::string_view>& args, CallOptions& options,
                      std::string& error) {
  std::vector<std::string_view> positional;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--url") {
      if (i + 1 >= args.size()) {
        error = "missing value for --url";
        return false;
      }
      options.url = std::string(args[++i]);
      continue;
    }
    if (token == "--timeout-ms") {
      if (i + 1 >= args.size()) {
        error = "missing value for --timeout-ms";
        return false;
      }
      std::uint32_t timeout_ms = 0;
      if (!ParseUnsigned<std::uint32_t>(args[++i], 1, 600000, timeout_ms)) {
        error = "--timeout-ms must be an integer in 1..600000";
        return false;
      }
      options.timeout = std::chrono::milliseconds(timeout_ms);
      continue;
    }
    if (token.size() > 1 && token.front() == '-' && token[1] == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positional.push_back(token);
  }

  if (positional.empty() || positional.size() > 2) {
    error = "call requires <method> and at most one params-json argument";
    return false;
  }
  options.method = std::string(positional[0]);
  if (positional.size() == 2) {
    options.params_json = std::string(positional[1]);
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "hwbridge " << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate-config requires exactly 1 argument: <file>\n";
    return kExitUsage;
  }

  const std::string path(args.front());
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    std::cerr << "error: config file not found: " << path << '\n';
    return kExitFailure;
  }

  config::GatewayConfig config;
  config::ValidationReport report;
  std::string error;
  if (!config::LoadGatewayConfigFile(path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintIssues(path, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << path << '\n';
  return kExitSuccess;
}

int CommandInitConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: init-config requires exactly 1 argument: <file>\n";
    return kExitUsage;
  }

  const fs::path path(args.front());
  std::error_code ec;
  if (fs::exists(path, ec)) {
    std::cerr << "error: refusing to overwrite existing file: " << path.string() << '\n';
    return kExitFailure;
  }

  std::string error;
  const std::string text = core::json::Serialize(config::ToJson(config::GatewayConfig{})) + "\n";
  if (!core::WriteTextFileAtomic(path, text, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "wrote: " << path.string() << '\n';
  return kExitSuccess;
}

int CommandServe(const std::vector<std::string_view>& args) {
  ServeOptions options;
  std::string error;
  if (!ParseServeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::GatewayConfig config;
  config::ValidationReport report;
  if (!config::LoadGatewayConfigFile(options.config_path, config, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (report.valid && options.port.has_value()) {
    config.port = *options.port;
    config::ValidateGatewayConfig(config, report);
  }
  if (!report.valid) {
    PrintIssues(options.config_path, report);
    return kExitConfigInvalid;
  }

  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  if (options.log_level.has_value()) {
    level = *options.log_level;
  } else if (!core::logging::ParseLogLevel(config.log_level, level, error)) {
    std::cerr << "error: logLevel: " << error << '\n';
    return kExitConfigInvalid;
  }
  const core::logging::Logger root(level);
  const core::logging::Logger logger = root.Child("main");

  services::GatewayServices services(config, root.Child("services"));
  if (!services.Start(error)) {
    logger.Error("gateway services failed to start", {{"error", error}});
    return kExitStartupFailed;
  }

  rpc::Dispatcher dispatcher(root.Child("rpc"));
  rpc::RegisterGatewayMethods(dispatcher, services);

  transport::GatewayServer server(config, dispatcher, services, root.Child("gateway"));
  if (!server.Start(error)) {
    logger.Error("gateway failed to start", {{"error", error}});
    services.Stop();
    return kExitStartupFailed;
  }

  logger.Info("gateway running",
              {{"host", config.host},
               {"port", std::to_string(server.BoundPort())},
               {"tls", config.use_tls ? "true" : "false"}});

  boost::asio::io_context signals_io;
  boost::asio::signal_set signals(signals_io, SIGINT, SIGTERM);
  signals.async_wait([&logger](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      logger.Info("shutdown requested", {{"signal", std::to_string(signal_number)}});
    }
  });
  signals_io.run();

  server.Stop();
  services.Stop();
  logger.Info("gateway stopped");
  return kExitSuccess;
}

int CommandCall(const std::vector<std::string_view>& args) {
  CallOptions options;
  std::string error;
  if (!ParseCallOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::json::Value params;
  if (!core::json::Parse(options.params_json, params, error)) {
    std::cerr << "error: params-json is not valid JSON: " << error << '\n';
    return kExitUsage;
  }

  client::ClientOptions client_options;
  client_options.url = options.url;
  client_options.request_timeout = options.timeout;
  client_options.insecure_tls = true;

  client::BridgeClient client(core::logging::Logger(core::logging::LogLevel::kWarn).Child("client"));
  if (!client.Connect(client_options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitRpcCallFailed;
  }

  core::json::Value result;
  core::errors::RpcError rpc_error;
  const bool ok = client.Call(options.method, std::move(params), result, rpc_error);
  client.Close();
  if (!ok) {
    std::cerr << "rpc error " << rpc_error.code << ": " << rpc_error.message;
    if (rpc_error.data.has_value()) {
      std::cerr << " (" << *rpc_error.data << ")";
    }
    std::cerr << '\n';
    return kExitRpcCallFailed;
  }

  std::cout << core::json::Serialize(result) << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "serve") {
    return CommandServe(args);
  }
  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }
  if (command == "init-config") {
    return CommandInitConfig(args);
  }
  if (command == "call") {
    return CommandCall(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace hwbridge::cli
