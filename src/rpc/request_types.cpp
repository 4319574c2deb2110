#include "rpc/request_types.hpp"

#include "core/json_fields.hpp"

namespace hwbridge::rpc {

namespace {

using core::errors::RpcError;
using core::errors::RpcErrorCode;
using core::json::Value;

constexpr std::int64_t kMaxTimeoutMs = 600000;
constexpr std::int64_t kMaxReceiveBytes = 1024 * 1024;

bool InvalidParams(RpcError& error, std::string detail) {
  error.Set(RpcErrorCode::kInvalidParams, "Invalid params");
  error.data = std::move(detail);
  return false;
}

bool ReadRequiredString(const Value& params, std::string_view key, std::string& out,
                        RpcError& error) {
  std::string detail;
  if (!core::json::ReadString(params, key, out, true, detail)) {
    return InvalidParams(error, detail);
  }
  if (out.empty()) {
    return InvalidParams(error, std::string(key) + " must not be empty");
  }
  return true;
}

bool ReadOptional(const Value& params, std::string_view key, std::string& out, RpcError& error) {
  std::string detail;
  if (!core::json::ReadString(params, key, out, false, detail)) {
    return InvalidParams(error, detail);
  }
  return true;
}

bool ReadEncoding(const Value& params, core::PayloadEncoding& encoding, RpcError& error) {
  std::string raw;
  if (!ReadOptional(params, "encoding", raw, error)) {
    return false;
  }
  if (raw.empty()) {
    return true;
  }
  std::string detail;
  if (!core::ParsePayloadEncoding(raw, encoding, detail)) {
    return InvalidParams(error, detail);
  }
  return true;
}

bool ReadTimeout(const Value& params, std::string_view key,
                 std::optional<std::chrono::milliseconds>& timeout, RpcError& error) {
  if (core::json::IsAbsent(params.Find(key))) {
    return true;
  }
  std::int64_t value = 0;
  std::string detail;
  if (!core::json::ReadBoundedInteger(params, key, 1, kMaxTimeoutMs, value, true, detail)) {
    return InvalidParams(error, detail);
  }
  timeout = std::chrono::milliseconds(value);
  return true;
}

bool ReadTimeout(const Value& params, std::string_view key, std::chrono::milliseconds& timeout,
                 RpcError& error) {
  std::optional<std::chrono::milliseconds> parsed;
  if (!ReadTimeout(params, key, parsed, error)) {
    return false;
  }
  if (parsed.has_value()) {
    timeout = *parsed;
  }
  return true;
}

bool ReadPort(const Value& params, std::uint16_t& port, RpcError& error) {
  std::int64_t value = 0;
  std::string detail;
  if (!core::json::ReadBoundedInteger(params, "port", 1, 65535, value, true, detail)) {
    return InvalidParams(error, detail);
  }
  port = static_cast<std::uint16_t>(value);
  return true;
}

} // namespace

bool ParseRequest(const Value& params, EnumerateRequest& request, RpcError& error) {
  std::string detail;
  if (!core::json::ReadBool(params, "forceRefresh", request.force_refresh, detail)) {
    return InvalidParams(error, detail);
  }
  return true;
}

bool ParseRequest(const Value& params, DeviceRequest& request, RpcError& error) {
  return ReadRequiredString(params, "deviceId", request.device_id, error);
}

bool ParseRequest(const Value& params, PrintRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error)) {
    return false;
  }
  std::string detail;
  if (!core::json::ReadString(params, "data", request.data, true, detail)) {
    return InvalidParams(error, detail);
  }
  std::string format;
  if (!ReadOptional(params, "format", format, error)) {
    return false;
  }
  if (!printer::ParsePrintFormat(format, request.format)) {
    error.Set(RpcErrorCode::kValidationFailed,
              "Unsupported print format '" + format + "' (expected raw|escpos|zpl|epl)");
    return false;
  }
  return ReadEncoding(params, request.encoding, error);
}

bool ParseRequest(const Value& params, SerialOpenRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error)) {
    return false;
  }
  std::string detail;
  if (!sessions::ParseSerialConfig(params, request.config, detail)) {
    error.Set(RpcErrorCode::kValidationFailed, detail);
    return false;
  }
  return true;
}

bool ParseRequest(const Value& params, SendRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error)) {
    return false;
  }
  std::string detail;
  if (!core::json::ReadString(params, "data", request.data, true, detail)) {
    return InvalidParams(error, detail);
  }
  return ReadEncoding(params, request.encoding, error);
}

bool ParseRequest(const Value& params, ReceiveRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error)) {
    return false;
  }
  std::int64_t max_bytes = static_cast<std::int64_t>(request.max_bytes);
  std::string detail;
  if (!core::json::ReadBoundedInteger(params, "maxBytes", 1, kMaxReceiveBytes, max_bytes, false,
                                      detail)) {
    return InvalidParams(error, detail);
  }
  request.max_bytes = static_cast<std::size_t>(max_bytes);
  if (!ReadTimeout(params, "timeout", request.timeout, error)) {
    return false;
  }
  return ReadEncoding(params, request.encoding, error);
}

bool ParseRequest(const Value& params, UsbSendReportRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error)) {
    return false;
  }
  std::int64_t report_id = request.report_id;
  std::string detail;
  if (!core::json::ReadBoundedInteger(params, "reportId", 0, 255, report_id, false, detail)) {
    return InvalidParams(error, detail);
  }
  request.report_id = static_cast<std::uint8_t>(report_id);
  if (!core::json::ReadString(params, "data", request.data, true, detail)) {
    return InvalidParams(error, detail);
  }
  return ReadEncoding(params, request.encoding, error);
}

bool ParseRequest(const Value& params, UsbReceiveReportRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error)) {
    return false;
  }
  if (!ReadTimeout(params, "timeout", request.timeout, error)) {
    return false;
  }
  return ReadEncoding(params, request.encoding, error);
}

bool ParseRequest(const Value& params, NetworkConnectRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error) ||
      !ReadRequiredString(params, "host", request.host, error) ||
      !ReadPort(params, request.port, error) ||
      !ReadOptional(params, "protocol", request.protocol, error) ||
      !ReadTimeout(params, "timeout", request.timeout, error)) {
    return false;
  }
  if (request.protocol.empty()) {
    request.protocol = "tcp";
  }
  if (request.protocol != "tcp") {
    error.Set(RpcErrorCode::kUnsupportedOperation,
              "Unsupported protocol '" + request.protocol + "' (only tcp is supported)");
    return false;
  }
  return true;
}

bool ParseRequest(const Value& params, NetworkStatusRequest& request, RpcError& error) {
  std::string detail;
  if (!core::json::ReadOptionalString(params, "deviceId", request.device_id, detail)) {
    return InvalidParams(error, detail);
  }
  return true;
}

bool ParseRequest(const Value& params, NetworkPingRequest& request, RpcError& error) {
  if (!ReadOptional(params, "deviceId", request.device_id, error) ||
      !ReadRequiredString(params, "host", request.host, error) ||
      !ReadPort(params, request.port, error) ||
      !ReadTimeout(params, "timeout", request.timeout, error)) {
    return false;
  }
  if (request.device_id.empty()) {
    request.device_id = request.host + ":" + std::to_string(request.port);
  }
  return true;
}

bool ParseRequest(const Value& params, BiometricEnrollRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error) ||
      !ReadRequiredString(params, "userId", request.user_id, error) ||
      !ReadOptional(params, "userName", request.user_name, error)) {
    return false;
  }
  std::string detail;
  if (!core::json::ReadString(params, "biometricData", request.biometric_data, false, detail)) {
    return InvalidParams(error, detail);
  }
  return true;
}

bool ParseRequest(const Value& params, BiometricAuthenticateRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error) ||
      !ReadRequiredString(params, "userId", request.user_id, error)) {
    return false;
  }
  std::string detail;
  if (!core::json::ReadString(params, "biometricData", request.biometric_data, true, detail)) {
    return InvalidParams(error, detail);
  }
  return true;
}

bool ParseRequest(const Value& params, BiometricIdentifyRequest& request, RpcError& error) {
  if (!ReadRequiredString(params, "deviceId", request.device_id, error)) {
    return false;
  }
  std::string detail;
  if (!core::json::ReadString(params, "biometricData", request.biometric_data, true, detail)) {
    return InvalidParams(error, detail);
  }
  return true;
}

bool ParseRequest(const Value& params, BiometricUserRequest& request, RpcError& error) {
  return ReadRequiredString(params, "deviceId", request.device_id, error) &&
         ReadRequiredString(params, "userId", request.user_id, error);
}

bool ParseRequest(const Value& params, QueueJobsRequest& request, RpcError& error) {
  std::string detail;
  if (!core::json::ReadOptionalString(params, "deviceId", request.filter.device_id, detail)) {
    return InvalidParams(error, detail);
  }
  std::optional<std::string> status;
  if (!core::json::ReadOptionalString(params, "status", status, detail)) {
    return InvalidParams(error, detail);
  }
  if (status.has_value()) {
    queue::JobStatus parsed = queue::JobStatus::kPending;
    if (!queue::ParseJobStatus(*status, parsed)) {
      return InvalidParams(error, "status must be one of "
                                  "pending|processing|completed|failed|cancelled");
    }
    request.filter.status = parsed;
  }
  std::int64_t limit = static_cast<std::int64_t>(request.filter.limit);
  if (!core::json::ReadBoundedInteger(params, "limit", 1, 1000, limit, false, detail)) {
    return InvalidParams(error, detail);
  }
  request.filter.limit = static_cast<std::size_t>(limit);
  return true;
}

bool ParseRequest(const Value& params, QueueCancelRequest& request, RpcError& error) {
  return ReadRequiredString(params, "jobId", request.job_id, error);
}

bool ParseDiscoverRequest(const Value& params, const config::DiscoveryConfig& defaults,
                          network::DiscoveryOptions& options, RpcError& error) {
  options.subnet.clear();
  options.ports = defaults.ports;
  options.timeout = defaults.timeout;
  options.max_concurrent = defaults.max_concurrent;

  if (!ReadOptional(params, "subnet", options.subnet, error)) {
    return false;
  }
  std::string detail;
  if (!core::json::ReadPortArray(params, "ports", options.ports, detail)) {
    return InvalidParams(error, detail);
  }
  if (options.ports.empty()) {
    return InvalidParams(error, "ports must not be empty");
  }
  if (!ReadTimeout(params, "timeout", options.timeout, error)) {
    return false;
  }
  std::int64_t max_concurrent = options.max_concurrent;
  if (!core::json::ReadBoundedInteger(params, "maxConcurrent", 1, 1024, max_concurrent, false,
                                      detail)) {
    return InvalidParams(error, detail);
  }
  options.max_concurrent = static_cast<std::uint32_t>(max_concurrent);
  return true;
}

} // namespace hwbridge::rpc
