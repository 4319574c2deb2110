#include "config/gateway_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_fields.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace hwbridge::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void ReportUnknownKeys(const JsonValue& object, const std::set<std::string>& known,
                       const std::string& prefix, ValidationReport& report) {
  for (const auto& [key, value] : object.object_value) {
    (void)value;
    if (known.count(key) == 0U) {
      AddIssue(report, prefix + key, "unknown key");
    }
  }
}

// Each field reader records an issue at `path` instead of stopping, so one
// validation pass reports every problem in the file.
void ReadStringField(const JsonValue& object, std::string_view key, const std::string& path,
                     std::string& out, ValidationReport& report) {
  std::string error;
  if (!core::json::ReadString(object, key, out, false, error)) {
    AddIssue(report, path, "must be a string");
  }
}

void ReadBoolField(const JsonValue& object, std::string_view key, const std::string& path,
                   bool& out, ValidationReport& report) {
  std::string error;
  if (!core::json::ReadBool(object, key, out, error)) {
    AddIssue(report, path, "must be a boolean");
  }
}

template <typename T>
void ReadUnsignedField(const JsonValue& object, std::string_view key, const std::string& path,
                       std::int64_t min_value, std::int64_t max_value, T& out,
                       ValidationReport& report) {
  std::int64_t value = static_cast<std::int64_t>(out);
  std::string error;
  if (!core::json::ReadBoundedInteger(object, key, min_value, max_value, value, false, error)) {
    AddIssue(report, path,
             "must be an integer between " + std::to_string(min_value) + " and " +
                 std::to_string(max_value));
    return;
  }
  out = static_cast<T>(value);
}

void ReadMillisField(const JsonValue& object, std::string_view key, const std::string& path,
                     std::int64_t min_value, std::chrono::milliseconds& out,
                     ValidationReport& report) {
  std::int64_t value = out.count();
  ReadUnsignedField(object, key, path, min_value, 86'400'000, value, report);
  out = std::chrono::milliseconds(value);
}

void ParseDiscovery(const JsonValue& root, DiscoveryConfig& discovery, ValidationReport& report) {
  const JsonValue* section = root.Find("discovery");
  if (core::json::IsAbsent(section)) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, "discovery", "must be an object");
    return;
  }
  ReportUnknownKeys(*section, {"ports", "timeout", "maxConcurrent"}, "discovery.", report);

  std::string error;
  if (!core::json::ReadPortArray(*section, "ports", discovery.ports, error)) {
    AddIssue(report, "discovery.ports", "must be an array of integers between 1 and 65535");
  }
  ReadMillisField(*section, "timeout", "discovery.timeout", 1, discovery.timeout, report);
  ReadUnsignedField(*section, "maxConcurrent", "discovery.maxConcurrent", 1, 1024,
                    discovery.max_concurrent, report);
}

void ParseNetwork(const JsonValue& root, NetworkConfig& network, ValidationReport& report) {
  const JsonValue* section = root.Find("network");
  if (core::json::IsAbsent(section)) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, "network", "must be an object");
    return;
  }
  ReportUnknownKeys(*section, {"connectTimeout", "pingTimeout", "maxConnections"}, "network.",
                    report);
  ReadMillisField(*section, "connectTimeout", "network.connectTimeout", 1,
                  network.connect_timeout, report);
  ReadMillisField(*section, "pingTimeout", "network.pingTimeout", 1, network.ping_timeout,
                  report);
  ReadUnsignedField(*section, "maxConnections", "network.maxConnections", 1, 4096,
                    network.max_connections, report);
}

void ParseQueue(const JsonValue& root, QueueConfig& queue, ValidationReport& report) {
  const JsonValue* section = root.Find("queue");
  if (core::json::IsAbsent(section)) {
    return;
  }
  if (!section->IsObject()) {
    AddIssue(report, "queue", "must be an object");
    return;
  }
  ReportUnknownKeys(*section,
                    {"retryInterval", "maxRetryAttempts", "maxQueueSize", "pollInterval"},
                    "queue.", report);
  ReadMillisField(*section, "retryInterval", "queue.retryInterval", 0, queue.retry_interval,
                  report);
  ReadUnsignedField(*section, "maxRetryAttempts", "queue.maxRetryAttempts", 0, 100,
                    queue.max_retry_attempts, report);
  ReadUnsignedField(*section, "maxQueueSize", "queue.maxQueueSize", 1, 1'000'000,
                    queue.max_queue_size, report);
  ReadMillisField(*section, "pollInterval", "queue.pollInterval", 10, queue.poll_interval,
                  report);
}

} // namespace

void ValidateGatewayConfig(const GatewayConfig& config, ValidationReport& report) {
  if (config.host.empty()) {
    AddIssue(report, "host", "must not be empty");
  }
  if (config.use_tls) {
    if (config.cert_path.empty()) {
      AddIssue(report, "certPath", "is required when useTls is true");
    }
    if (config.key_path.empty()) {
      AddIssue(report, "keyPath", "is required when useTls is true");
    }
  }
  if (config.enable_mutual_tls) {
    if (!config.use_tls) {
      AddIssue(report, "enableMutualTls", "requires useTls to be true");
    }
    if (config.client_ca_path.empty()) {
      AddIssue(report, "clientCaPath", "is required when enableMutualTls is true");
    }
  }
  if (config.database_path.empty()) {
    AddIssue(report, "databasePath", "must not be empty");
  }
  if (config.discovery.ports.empty()) {
    AddIssue(report, "discovery.ports", "must list at least one port");
  }

  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  std::string level_error;
  if (!core::logging::ParseLogLevel(config.log_level, level, level_error)) {
    AddIssue(report, "logLevel", "must be one of " + core::logging::ExpectedLogLevelList());
  }

  report.valid = report.issues.empty();
}

bool ParseGatewayConfigText(std::string_view json_text, GatewayConfig& config,
                            ValidationReport& report, std::string& error) {
  error.clear();
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    report.valid = false;
    return true;
  }
  if (!root.IsObject()) {
    AddIssue(report, "$", "config root must be a JSON object");
    report.valid = false;
    return true;
  }

  ReportUnknownKeys(root,
                    {"port", "host", "useTls", "certPath", "keyPath", "enableMutualTls",
                     "clientCaPath", "allowedOrigins", "maxConnections", "keepAliveInterval",
                     "connectionTimeout", "databasePath", "logLevel", "deviceFixturePath",
                     "watchInterval", "handlerThreads", "ioThreads", "discovery", "network",
                     "queue"},
                    "", report);

  ReadUnsignedField(root, "port", "port", 1, 65535, config.port, report);
  ReadStringField(root, "host", "host", config.host, report);
  ReadBoolField(root, "useTls", "useTls", config.use_tls, report);
  ReadStringField(root, "certPath", "certPath", config.cert_path, report);
  ReadStringField(root, "keyPath", "keyPath", config.key_path, report);
  ReadBoolField(root, "enableMutualTls", "enableMutualTls", config.enable_mutual_tls, report);
  ReadStringField(root, "clientCaPath", "clientCaPath", config.client_ca_path, report);

  std::string origins_error;
  if (!core::json::ReadStringArray(root, "allowedOrigins", config.allowed_origins,
                                   origins_error)) {
    AddIssue(report, "allowedOrigins", "must be an array of strings");
  }

  ReadUnsignedField(root, "maxConnections", "maxConnections", 1, 100000, config.max_connections,
                    report);
  ReadMillisField(root, "keepAliveInterval", "keepAliveInterval", 1000,
                  config.keep_alive_interval, report);
  ReadMillisField(root, "connectionTimeout", "connectionTimeout", 1000,
                  config.connection_timeout, report);
  ReadStringField(root, "databasePath", "databasePath", config.database_path, report);
  ReadStringField(root, "logLevel", "logLevel", config.log_level, report);
  ReadStringField(root, "deviceFixturePath", "deviceFixturePath", config.device_fixture_path,
                  report);
  ReadMillisField(root, "watchInterval", "watchInterval", 100, config.watch_interval, report);
  ReadUnsignedField(root, "handlerThreads", "handlerThreads", 1, 256, config.handler_threads,
                    report);
  ReadUnsignedField(root, "ioThreads", "ioThreads", 1, 64, config.io_threads, report);

  ParseDiscovery(root, config.discovery, report);
  ParseNetwork(root, config.network, report);
  ParseQueue(root, config.queue, report);

  ValidateGatewayConfig(config, report);
  return true;
}

bool LoadGatewayConfigFile(const std::string& path, GatewayConfig& config,
                           ValidationReport& report, std::string& error) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    report = ValidationReport{};
    ValidateGatewayConfig(config, report);
    return true;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "config path must point to a regular file: " + path;
    return false;
  }

  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  return ParseGatewayConfigText(text, config, report, error);
}

core::json::Value ToJson(const GatewayConfig& config) {
  using core::json::MakeBool;
  using core::json::MakeNumber;
  using core::json::MakeString;

  JsonValue ports = core::json::MakeArray();
  for (const auto port : config.discovery.ports) {
    ports.Push(MakeNumber(port));
  }

  JsonValue discovery = core::json::MakeObject();
  discovery.Set("ports", std::move(ports));
  discovery.Set("timeout", MakeNumber(static_cast<double>(config.discovery.timeout.count())));
  discovery.Set("maxConcurrent", MakeNumber(config.discovery.max_concurrent));

  JsonValue network = core::json::MakeObject();
  network.Set("connectTimeout",
              MakeNumber(static_cast<double>(config.network.connect_timeout.count())));
  network.Set("pingTimeout", MakeNumber(static_cast<double>(config.network.ping_timeout.count())));
  network.Set("maxConnections", MakeNumber(config.network.max_connections));

  JsonValue queue = core::json::MakeObject();
  queue.Set("retryInterval",
            MakeNumber(static_cast<double>(config.queue.retry_interval.count())));
  queue.Set("maxRetryAttempts", MakeNumber(config.queue.max_retry_attempts));
  queue.Set("maxQueueSize", MakeNumber(config.queue.max_queue_size));
  queue.Set("pollInterval", MakeNumber(static_cast<double>(config.queue.poll_interval.count())));

  JsonValue root = core::json::MakeObject();
  root.Set("port", MakeNumber(config.port));
  root.Set("host", MakeString(config.host));
  root.Set("useTls", MakeBool(config.use_tls));
  root.Set("certPath", MakeString(config.cert_path));
  root.Set("keyPath", MakeString(config.key_path));
  root.Set("enableMutualTls", MakeBool(config.enable_mutual_tls));
  root.Set("clientCaPath", MakeString(config.client_ca_path));
  root.Set("allowedOrigins", core::json::MakeStringArray(config.allowed_origins));
  root.Set("maxConnections", MakeNumber(config.max_connections));
  root.Set("keepAliveInterval",
           MakeNumber(static_cast<double>(config.keep_alive_interval.count())));
  root.Set("connectionTimeout",
           MakeNumber(static_cast<double>(config.connection_timeout.count())));
  root.Set("databasePath", MakeString(config.database_path));
  root.Set("logLevel", MakeString(config.log_level));
  root.Set("deviceFixturePath", MakeString(config.device_fixture_path));
  root.Set("watchInterval", MakeNumber(static_cast<double>(config.watch_interval.count())));
  root.Set("handlerThreads", MakeNumber(config.handler_threads));
  root.Set("ioThreads", MakeNumber(config.io_threads));
  root.Set("discovery", std::move(discovery));
  root.Set("network", std::move(network));
  root.Set("queue", std::move(queue));
  return root;
}

} // namespace hwbridge::config
