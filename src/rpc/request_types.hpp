#pragma once

#include "config/gateway_config.hpp"
#include "core/errors/rpc_error.hpp"
#include "core/json_dom.hpp"
#include "core/payload_encoding.hpp"
#include "network/discovery_scanner.hpp"
#include "printer/print_encoder.hpp"
#include "queue/job_store.hpp"
#include "sessions/serial_config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace hwbridge::rpc {

// Typed request shapes, one per method family. Parsing fills defaults, so
// handlers never inspect raw JSON. Missing or ill-typed members fail with
// -32602; values that parse but violate device rules fail with 1002.

struct EnumerateRequest {
  bool force_refresh = false;
};

struct DeviceRequest {
  std::string device_id;
};

struct PrintRequest {
  std::string device_id;
  std::string data;
  printer::PrintFormat format = printer::PrintFormat::kRaw;
  core::PayloadEncoding encoding = core::PayloadEncoding::kUtf8;
};

struct SerialOpenRequest {
  std::string device_id;
  sessions::SerialConfig config;
};

// serial.send and network.send.
struct SendRequest {
  std::string device_id;
  std::string data;
  core::PayloadEncoding encoding = core::PayloadEncoding::kUtf8;
};

// serial.receive and network.receive.
struct ReceiveRequest {
  std::string device_id;
  std::size_t max_bytes = 1024;
  std::chrono::milliseconds timeout{10000};
  core::PayloadEncoding encoding = core::PayloadEncoding::kUtf8;
};

struct UsbSendReportRequest {
  std::string device_id;
  std::uint8_t report_id = 0;
  std::string data;
  core::PayloadEncoding encoding = core::PayloadEncoding::kHex;
};

struct UsbReceiveReportRequest {
  std::string device_id;
  std::chrono::milliseconds timeout{5000};
  core::PayloadEncoding encoding = core::PayloadEncoding::kHex;
};

struct NetworkConnectRequest {
  std::string device_id;
  std::string host;
  std::uint16_t port = 0;
  std::string protocol = "tcp";
  std::optional<std::chrono::milliseconds> timeout;
};

struct NetworkStatusRequest {
  std::optional<std::string> device_id;
};

struct NetworkPingRequest {
  // Defaults to "host:port" when absent.
  std::string device_id;
  std::string host;
  std::uint16_t port = 0;
  std::optional<std::chrono::milliseconds> timeout;
};

struct BiometricEnrollRequest {
  std::string device_id;
  std::string user_id;
  std::string user_name;
  std::string biometric_data;
};

struct BiometricAuthenticateRequest {
  std::string device_id;
  std::string user_id;
  std::string biometric_data;
};

struct BiometricIdentifyRequest {
  std::string device_id;
  std::string biometric_data;
};

struct BiometricUserRequest {
  std::string device_id;
  std::string user_id;
};

struct QueueJobsRequest {
  queue::JobFilter filter;
};

struct QueueCancelRequest {
  std::string job_id;
};

bool ParseRequest(const core::json::Value& params, EnumerateRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, DeviceRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, PrintRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, SerialOpenRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, SendRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, ReceiveRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, UsbSendReportRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, UsbReceiveReportRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, NetworkConnectRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, NetworkStatusRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, NetworkPingRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, BiometricEnrollRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, BiometricAuthenticateRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, BiometricIdentifyRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, BiometricUserRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, QueueJobsRequest& request,
                  core::errors::RpcError& error);
bool ParseRequest(const core::json::Value& params, QueueCancelRequest& request,
                  core::errors::RpcError& error);

// Discovery options start from the configured defaults.
bool ParseDiscoverRequest(const core::json::Value& params, const config::DiscoveryConfig& defaults,
                          network::DiscoveryOptions& options, core::errors::RpcError& error);

} // namespace hwbridge::rpc
