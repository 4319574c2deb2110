#include "rpc/request_types.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using hwbridge::core::errors::RpcError;
using hwbridge::core::errors::RpcErrorCode;
using hwbridge::core::errors::ToInt;
using hwbridge::core::json::Value;

namespace {

Value Params(const std::string& text) {
  Value value;
  std::string error;
  REQUIRE(hwbridge::core::json::Parse(text, value, error));
  return value;
}

} // namespace

TEST_CASE("Missing deviceId is an invalid-params error", "[rpc][requests]") {
  hwbridge::rpc::DeviceRequest request;
  RpcError error;
  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(Params("{}"), request, error));
  REQUIRE(error.code == ToInt(RpcErrorCode::kInvalidParams));
  REQUIRE(error.data.value() == "deviceId is required");

  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(Params(R"({"deviceId":""})"), request, error));
  REQUIRE(error.data.value() == "deviceId must not be empty");
}

TEST_CASE("Print requests default to raw utf8 and reject unknown formats", "[rpc][requests]") {
  hwbridge::rpc::PrintRequest request;
  RpcError error;
  REQUIRE(hwbridge::rpc::ParseRequest(Params(R"({"deviceId":"p1","data":"hi"})"), request, error));
  REQUIRE(request.format == hwbridge::printer::PrintFormat::kRaw);
  REQUIRE(request.encoding == hwbridge::core::PayloadEncoding::kUtf8);

  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(
      Params(R"({"deviceId":"p1","data":"hi","format":"pdf"})"), request, error));
  REQUIRE(error.code == ToInt(RpcErrorCode::kValidationFailed));

  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(
      Params(R"({"deviceId":"p1","data":"hi","encoding":"rot13"})"), request, error));
  REQUIRE(error.code == ToInt(RpcErrorCode::kInvalidParams));
}

TEST_CASE("Serial open maps bad settings to validation errors", "[rpc][requests]") {
  hwbridge::rpc::SerialOpenRequest request;
  RpcError error;
  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(
      Params(R"({"deviceId":"serial_com1","parity":"weird"})"), request, error));
  REQUIRE(error.code == ToInt(RpcErrorCode::kValidationFailed));
}

TEST_CASE("Receive bounds maxBytes and timeout", "[rpc][requests]") {
  hwbridge::rpc::ReceiveRequest request;
  RpcError error;
  REQUIRE(hwbridge::rpc::ParseRequest(Params(R"({"deviceId":"s1"})"), request, error));
  REQUIRE(request.max_bytes == 1024U);
  REQUIRE(request.timeout == std::chrono::milliseconds(10000));

  REQUIRE_FALSE(
      hwbridge::rpc::ParseRequest(Params(R"({"deviceId":"s1","maxBytes":0})"), request, error));
  REQUIRE_FALSE(
      hwbridge::rpc::ParseRequest(Params(R"({"deviceId":"s1","timeout":-5})"), request, error));
  REQUIRE(error.code == ToInt(RpcErrorCode::kInvalidParams));
}

TEST_CASE("Network connect accepts tcp only", "[rpc][requests]") {
  hwbridge::rpc::NetworkConnectRequest request;
  RpcError error;
  REQUIRE(hwbridge::rpc::ParseRequest(
      Params(R"({"deviceId":"n1","host":"127.0.0.1","port":9100})"), request, error));
  REQUIRE(request.protocol == "tcp");
  REQUIRE_FALSE(request.timeout.has_value());

  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(
      Params(R"({"deviceId":"n1","host":"127.0.0.1","port":9100,"protocol":"udp"})"), request,
      error));
  REQUIRE(error.code == ToInt(RpcErrorCode::kUnsupportedOperation));

  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(
      Params(R"({"deviceId":"n1","host":"127.0.0.1","port":70000})"), request, error));
  REQUIRE(error.code == ToInt(RpcErrorCode::kInvalidParams));
}

TEST_CASE("Ping derives a device id from the endpoint", "[rpc][requests]") {
  hwbridge::rpc::NetworkPingRequest request;
  RpcError error;
  REQUIRE(hwbridge::rpc::ParseRequest(Params(R"({"host":"10.0.0.9","port":631})"), request,
                                      error));
  REQUIRE(request.device_id == "10.0.0.9:631");
}

TEST_CASE("Queue listing validates status and limit", "[rpc][requests]") {
  hwbridge::rpc::QueueJobsRequest request;
  RpcError error;
  REQUIRE(hwbridge::rpc::ParseRequest(Params(R"({"status":"failed","limit":5})"), request, error));
  REQUIRE(request.filter.status == hwbridge::queue::JobStatus::kFailed);
  REQUIRE(request.filter.limit == 5U);

  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(Params(R"({"status":"lost"})"), request, error));
  REQUIRE_FALSE(hwbridge::rpc::ParseRequest(Params(R"({"limit":5000})"), request, error));
}

TEST_CASE("Discover options start from configured defaults", "[rpc][requests]") {
  hwbridge::config::DiscoveryConfig defaults;
  defaults.max_concurrent = 12;
  hwbridge::network::DiscoveryOptions options;
  RpcError error;
  REQUIRE(hwbridge::rpc::ParseDiscoverRequest(Params(R"({"subnet":"127.0.0"})"), defaults,
                                              options, error));
  REQUIRE(options.subnet == "127.0.0");
  REQUIRE(options.ports == defaults.ports);
  REQUIRE(options.max_concurrent == 12U);

  REQUIRE_FALSE(
      hwbridge::rpc::ParseDiscoverRequest(Params(R"({"ports":[]})"), defaults, options, error));
  REQUIRE(error.code == ToInt(RpcErrorCode::kInvalidParams));
}
