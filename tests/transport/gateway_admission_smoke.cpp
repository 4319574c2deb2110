#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "client/bridge_client.hpp"
#include "config/gateway_config.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/gateway_methods.hpp"
#include "services/gateway_services.hpp"
#include "transport/gateway_server.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

namespace {

using hwbridge::client::BridgeClient;
using hwbridge::client::ClientOptions;

constexpr auto kWait = std::chrono::milliseconds(5000);
constexpr const char* kAllowedOrigin = "http://localhost:3000";

ClientOptions OptionsFor(std::uint16_t port, const std::string& origin) {
  ClientOptions options;
  options.url = "ws://127.0.0.1:" + std::to_string(port);
  options.origin = origin;
  options.connect_timeout = std::chrono::milliseconds(2000);
  options.request_timeout = std::chrono::milliseconds(5000);
  return options;
}

std::unique_ptr<BridgeClient> ConnectAdmitted(const hwbridge::core::logging::Logger& logger,
                                              std::uint16_t port) {
  auto client = std::make_unique<BridgeClient>(logger.Child("client"));
  std::string error;
  if (!client->Connect(OptionsFor(port, kAllowedOrigin), error)) {
    hwbridge::tests::common::Fail("client connect failed: " + error);
  }
  hwbridge::core::json::Value params;
  if (!client->WaitForNotification("server.connected", kWait, params)) {
    hwbridge::tests::common::Fail("expected server.connected notification");
  }
  if (client->ConnectionId().empty()) {
    hwbridge::tests::common::Fail("expected server.connected to carry a connection id");
  }
  return client;
}

} // namespace

int main() {
  using hwbridge::tests::common::Fail;
  using hwbridge::tests::common::WaitUntil;

  const auto temp_root = hwbridge::tests::common::CreateUniqueTempDir("hwbridge-gateway-smoke");

  std::ostringstream log_sink;
  const hwbridge::core::logging::Logger logger(hwbridge::core::logging::LogLevel::kDebug,
                                               log_sink);

  hwbridge::config::GatewayConfig config;
  config.host = "127.0.0.1";
  config.port = 0;
  config.allowed_origins = {kAllowedOrigin};
  config.max_connections = 2;
  config.database_path = (temp_root / "queue.db").string();

  hwbridge::services::GatewayServices services(config, logger.Child("services"));
  std::string error;
  if (!services.Start(error)) {
    Fail("services failed to start: " + error);
  }
  hwbridge::rpc::Dispatcher dispatcher(logger.Child("rpc"));
  hwbridge::rpc::RegisterGatewayMethods(dispatcher, services);

  hwbridge::transport::GatewayServer server(config, dispatcher, services, logger.Child("gateway"));
  if (!server.Start(error)) {
    Fail("gateway failed to start: " + error);
  }
  const std::uint16_t port = server.BoundPort();
  if (port == 0U) {
    Fail("expected an ephemeral port to be bound");
  }

  // Disallowed origin: upgrade completes, then 1008.
  {
    BridgeClient intruder(logger.Child("intruder"));
    if (!intruder.Connect(OptionsFor(port, "http://evil.example"), error)) {
      Fail("intruder upgrade failed: " + error);
    }
    const auto code = intruder.WaitForClose(kWait);
    if (!code.has_value() || *code != 1008U) {
      Fail("expected disallowed origin to be closed with 1008");
    }
  }

  auto first = ConnectAdmitted(logger, port);
  auto second = ConnectAdmitted(logger, port);
  if (first->ConnectionId() == second->ConnectionId()) {
    Fail("expected distinct connection ids");
  }
  if (!WaitUntil([&server]() { return server.ConnectionCount() == 2U; }, kWait)) {
    Fail("expected two registered connections");
  }

  // Table full: the third socket is closed with 1013.
  {
    BridgeClient overflow(logger.Child("overflow"));
    if (!overflow.Connect(OptionsFor(port, kAllowedOrigin), error)) {
      Fail("overflow upgrade failed: " + error);
    }
    const auto code = overflow.WaitForClose(kWait);
    if (!code.has_value() || *code != 1013U) {
      Fail("expected connection over the limit to be closed with 1013");
    }
  }

  // Simulated catalog when no OS enumerator is configured.
  hwbridge::core::json::Value result;
  hwbridge::core::errors::RpcError rpc_error;
  if (!first->Call("devices.enumerate", hwbridge::core::json::MakeObject(), result, rpc_error)) {
    Fail("devices.enumerate failed: " + rpc_error.message);
  }
  const auto* source = result.Find("source");
  if (source == nullptr || source->string_value != "simulated") {
    Fail("expected simulated device source");
  }
  const auto* listed = result.Find("devices");
  if (listed == nullptr || listed->array_value.empty()) {
    Fail("expected simulated devices to be listed");
  }

  // Error mapping survives the round trip.
  hwbridge::core::json::Value params = hwbridge::core::json::MakeObject();
  params.Set("deviceId", hwbridge::core::json::MakeString("missing-device"));
  if (first->Call("devices.get", params, result, rpc_error) || rpc_error.code != 1001) {
    Fail("expected devices.get of an unknown id to fail with 1001");
  }
  if (first->Call("no.such.method", hwbridge::core::json::MakeObject(), result, rpc_error) ||
      rpc_error.code != -32601) {
    Fail("expected unknown method to fail with -32601");
  }

  // Close methods only close sessions of their own kind.
  hwbridge::core::json::Value usb_params = hwbridge::core::json::MakeObject();
  usb_params.Set("deviceId", hwbridge::core::json::MakeString("usbhid_1234_5678"));
  if (!first->Call("usb.open", usb_params, result, rpc_error)) {
    Fail("usb.open failed: " + rpc_error.message);
  }
  for (const char* method : {"serial.close", "network.disconnect"}) {
    if (!first->Call(method, usb_params, result, rpc_error)) {
      Fail(std::string(method) + " failed: " + rpc_error.message);
    }
  }
  if (!first->Call("usb.getStatus", usb_params, result, rpc_error) ||
      result.Find("isConnected") == nullptr || !result.Find("isConnected")->bool_value) {
    Fail("expected the USB session to stay open after other close methods");
  }
  if (!first->Call("usb.close", usb_params, result, rpc_error) ||
      result.Find("wasOpen") == nullptr || !result.Find("wasOpen")->bool_value) {
    Fail("expected usb.close to close the USB session");
  }

  // Broadcasts reach every open connection.
  services.PublishJobUpdate("job-smoke-1", hwbridge::queue::JobStatus::kCompleted);
  for (BridgeClient* client : {first.get(), second.get()}) {
    hwbridge::core::json::Value update;
    if (!client->WaitForNotification("queue.updated", kWait, update)) {
      Fail("expected queue.updated on every connection");
    }
    const auto* job_id = update.Find("jobId");
    const auto* status = update.Find("status");
    if (job_id == nullptr || job_id->string_value != "job-smoke-1" || status == nullptr ||
        status->string_value != "completed") {
      Fail("unexpected queue.updated payload");
    }
  }

  // A malformed frame gets an error response; the socket stays usable.
  if (!second->SendRaw("{not json", error)) {
    Fail("raw send failed: " + error);
  }
  if (!second->Call("system.getHealth", hwbridge::core::json::MakeObject(), result, rpc_error)) {
    Fail("expected the connection to survive a malformed frame: " + rpc_error.message);
  }
  if (!second->IsOpen()) {
    Fail("expected the connection to stay open");
  }

  // Watches end with the socket; sessions do not.
  if (!first->Call("devices.watch", hwbridge::core::json::MakeObject(), result, rpc_error)) {
    Fail("devices.watch failed: " + rpc_error.message);
  }
  const std::string watcher_id = first->ConnectionId();
  if (!services.Registry().IsWatching(watcher_id)) {
    Fail("expected the connection to be watching");
  }
  first->Close();
  if (!WaitUntil([&]() { return !services.Registry().IsWatching(watcher_id); }, kWait)) {
    Fail("expected a closed connection to stop watching");
  }
  if (!WaitUntil([&server]() { return server.ConnectionCount() == 1U; }, kWait)) {
    Fail("expected the closed connection to leave the table");
  }

  // Shutdown closes the remaining socket with 1001.
  server.Stop();
  const auto shutdown_code = second->WaitForClose(kWait);
  if (!shutdown_code.has_value() || *shutdown_code != 1001U) {
    Fail("expected shutdown to close with 1001");
  }
  second->Close();
  services.Stop();

  hwbridge::tests::common::AssertContains(log_sink.str(), "connection rejected");
  hwbridge::tests::common::RemovePathBestEffort(temp_root);
  return 0;
}
