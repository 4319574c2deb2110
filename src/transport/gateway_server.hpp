#pragma once

#include "config/gateway_config.hpp"
#include "core/logging/logger.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/notification_sink.hpp"
#include "services/gateway_services.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace hwbridge::transport {

// WebSocket front door of the gateway.
//
// Admission runs on the HTTP upgrade request before any frame is exchanged:
// a disallowed Origin is accepted and closed with 1008, then a full
// connection table closes the newcomer with 1013. Admitted sockets receive a
// `server.connected` notification carrying their connection id.
//
// Threads:
// - `ioThreads` run socket I/O; every connection lives on its own strand
// - `handlerThreads` run RPC handlers, so a slow device call never stalls
//   reads or writes on other connections
class GatewayServer final : public rpc::INotificationSink {
public:
  GatewayServer(config::GatewayConfig config, const rpc::Dispatcher& dispatcher,
                services::GatewayServices& services, core::logging::Logger logger);
  ~GatewayServer() override;

  GatewayServer(const GatewayServer&) = delete;
  GatewayServer& operator=(const GatewayServer&) = delete;

  // Binds synchronously. A port of 0 picks an ephemeral port (tests).
  bool Start(std::string& error);

  // Closes every connection with 1001, then joins all threads. The server
  // cannot be restarted.
  void Stop();

  std::uint16_t BoundPort() const;

  void Broadcast(const std::string& frame) override;
  bool SendTo(const std::string& connection_id, const std::string& frame) override;
  std::size_t ConnectionCount() const override;

  struct Impl;

private:
  std::shared_ptr<Impl> impl_;
};

} // namespace hwbridge::transport
