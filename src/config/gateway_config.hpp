#pragma once

#include "core/json_dom.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::config {

struct DiscoveryConfig {
  std::vector<std::uint16_t> ports = {9100, 631, 515, 4370};
  std::chrono::milliseconds timeout{2000};
  std::uint32_t max_concurrent = 50;
};

struct NetworkConfig {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds ping_timeout{5000};
  std::uint32_t max_connections = 50;
};

struct QueueConfig {
  std::chrono::milliseconds retry_interval{60000};
  std::uint32_t max_retry_attempts = 3;
  std::uint32_t max_queue_size = 1000;
  std::chrono::milliseconds poll_interval{1000};
};

// Complete runtime configuration of one gateway process. Defaults match what a
// fresh install runs with when no config file exists.
struct GatewayConfig {
  std::uint16_t port = 8443;
  std::string host = "localhost";
  bool use_tls = false;
  std::string cert_path;
  std::string key_path;
  bool enable_mutual_tls = false;
  std::string client_ca_path;
  std::vector<std::string> allowed_origins = {"*"};
  std::uint32_t max_connections = 100;
  std::chrono::milliseconds keep_alive_interval{30000};
  std::chrono::milliseconds connection_timeout{300000};
  std::string database_path = "data/queue.db";
  std::string log_level = "info";
  std::string device_fixture_path;
  std::chrono::milliseconds watch_interval{5000};
  std::uint32_t handler_threads = 4;
  std::uint32_t io_threads = 1;
  DiscoveryConfig discovery;
  NetworkConfig network;
  QueueConfig queue;
};

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Parses config JSON text on top of the defaults in `config`.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Populates `report.valid` and `report.issues`; `config` is only meaningful
//   when `report.valid` is true.
// - Parse errors are reported as a single issue under path `$`.
bool ParseGatewayConfigText(std::string_view json_text, GatewayConfig& config,
                            ValidationReport& report, std::string& error);

// Loads `path` when it exists; a missing file leaves defaults in place and
// reports valid. Returns false only when an existing file cannot be read.
bool LoadGatewayConfigFile(const std::string& path, GatewayConfig& config,
                           ValidationReport& report, std::string& error);

// Cross-field checks (TLS material, ranges). Called by the parser; exposed so
// CLI overrides can be re-validated after they are applied.
void ValidateGatewayConfig(const GatewayConfig& config, ValidationReport& report);

core::json::Value ToJson(const GatewayConfig& config);

} // namespace hwbridge::config
