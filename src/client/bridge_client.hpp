#pragma once

#include "core/errors/rpc_error.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace hwbridge::client {

struct GatewayUrl {
  bool tls = false;
  std::string host;
  std::string port;
  std::string target = "/";
};

// Accepts ws://host[:port][/path] and wss://...; the port defaults to 80/443.
bool ParseGatewayUrl(std::string_view url, GatewayUrl& parsed, std::string& error);

struct ClientOptions {
  std::string url = "ws://localhost:8443";
  // Sent as the Origin header when not empty.
  std::string origin;
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds request_timeout{30000};
  // Skip certificate verification for wss:// (self-signed local gateways).
  bool insecure_tls = false;
};

// Called on the client's I/O thread for every server notification.
using NotificationHandler =
    std::function<void(const std::string& method, const core::json::Value& params)>;

// JSON-RPC client for the gateway.
//
// Requests carry incrementing numeric ids and are matched to responses by id
// only, so concurrent Call()s from several threads may complete in any order.
// A request that sees no response within its timeout fails with
// "Request timeout: <method>"; when the socket drops every pending request
// fails with "Connection closed".
class BridgeClient {
public:
  explicit BridgeClient(core::logging::Logger logger);
  ~BridgeClient();

  BridgeClient(const BridgeClient&) = delete;
  BridgeClient& operator=(const BridgeClient&) = delete;

  bool Connect(const ClientOptions& options, std::string& error);
  void Close();
  bool IsOpen() const;

  void SetNotificationHandler(NotificationHandler handler);

  // Blocks until the response, the timeout or a disconnect.
  bool Call(const std::string& method, core::json::Value params, core::json::Value& result,
            core::errors::RpcError& error,
            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Fire-and-forget notification (no id).
  bool Notify(const std::string& method, core::json::Value params, std::string& error);

  // Sends a raw text frame; used to exercise protocol error paths.
  bool SendRaw(const std::string& frame, std::string& error);

  // Takes the oldest queued notification named `method`, waiting up to
  // `timeout` for one to arrive.
  bool WaitForNotification(const std::string& method, std::chrono::milliseconds timeout,
                           core::json::Value& params);

  // Waits until the server closes the socket. Returns the close code, or
  // nullopt on timeout.
  std::optional<std::uint16_t> WaitForClose(std::chrono::milliseconds timeout);

  // Id announced by `server.connected`; empty until it arrives.
  std::string ConnectionId() const;

  struct Impl;

private:
  std::shared_ptr<Impl> impl_;
};

} // namespace hwbridge::client
