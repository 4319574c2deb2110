#pragma once

#include <optional>
#include <string>
#include <utility>

namespace hwbridge::core::errors {

// JSON-RPC error codes. Negative values are reserved by JSON-RPC 2.0; the
// positive range classifies gateway domain failures so clients can branch on
// the code instead of matching message text.
enum class RpcErrorCode : int {
  kParseError = -32700,
  kInvalidRequest = -32600,
  kMethodNotFound = -32601,
  kInvalidParams = -32602,
  kInternalError = -32603,

  kDeviceNotFound = 1001,
  kValidationFailed = 1002,
  kDeviceBusy = 1003,
  kDeviceNotConnected = 1004,
  kDeviceIoError = 1005,
  kQueueFull = 1006,
  kJobNotFound = 1007,
  kUnsupportedOperation = 1008,
};

constexpr int ToInt(RpcErrorCode code) {
  return static_cast<int>(code);
}

struct RpcError {
  int code = ToInt(RpcErrorCode::kInternalError);
  std::string message;
  std::optional<std::string> data;

  RpcError() = default;
  RpcError(RpcErrorCode error_code, std::string error_message)
      : code(ToInt(error_code)), message(std::move(error_message)) {}

  void Set(RpcErrorCode error_code, std::string error_message) {
    code = ToInt(error_code);
    message = std::move(error_message);
    data.reset();
  }
};

} // namespace hwbridge::core::errors
