#pragma once

#include "config/gateway_config.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "core/payload_encoding.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hwbridge::network {

// Snapshot of one pooled connection; safe to hand out across threads.
struct ConnectionSnapshot {
  std::string device_id;
  std::string host;
  std::uint16_t port = 0;
  std::string protocol = "tcp";
  std::chrono::system_clock::time_point connected_at{};
  std::chrono::system_clock::time_point last_activity{};
  std::uint64_t bytes_written = 0;
  std::uint64_t bytes_read = 0;
  bool is_alive = false;
};

struct ConnectResult {
  bool success = false;
  // "connected" or "already_connected" on success.
  std::string status;
  std::string error;
  std::chrono::milliseconds response_time{0};
  ConnectionSnapshot connection;
};

struct DisconnectResult {
  bool success = true;
  // "disconnected" or "not_connected".
  std::string status;
};

struct PingResult {
  bool success = false;
  std::string device_id;
  std::string host;
  std::uint16_t port = 0;
  std::chrono::milliseconds response_time{0};
  bool is_online = false;
  std::chrono::system_clock::time_point timestamp{};
  std::string error;
};

// One pooled TCP socket per deviceId.
//
// Every connection owns a private io_context driven synchronously by the
// calling thread, so a slow peer only stalls requests for its own device.
// Connect/ping/send report failures through their result types and never
// throw.
class NetworkManager {
public:
  NetworkManager(config::NetworkConfig config, core::logging::Logger logger);
  ~NetworkManager();

  NetworkManager(const NetworkManager&) = delete;
  NetworkManager& operator=(const NetworkManager&) = delete;

  ConnectResult Connect(const std::string& device_id, const std::string& host, std::uint16_t port,
                        const std::string& protocol,
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  DisconnectResult Disconnect(const std::string& device_id);

  bool Send(const std::string& device_id, const core::Bytes& data, std::size_t& bytes_written,
            std::string& error);

  // Reads whatever arrives within `timeout`, up to `max_bytes`. A quiet peer
  // yields success with zero bytes.
  bool Receive(const std::string& device_id, std::size_t max_bytes,
               std::chrono::milliseconds timeout, core::Bytes& data, std::string& error);

  // Ephemeral connect probe; never touches the pool.
  PingResult Ping(const std::string& device_id, const std::string& host, std::uint16_t port,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

  // Dial, write and close for fire-and-forget deliveries (network printers).
  bool SendOnce(const std::string& host, std::uint16_t port, const core::Bytes& data,
                std::string& error) const;

  std::optional<ConnectionSnapshot> GetConnection(const std::string& device_id) const;
  std::vector<ConnectionSnapshot> ListConnections() const;
  std::size_t ActiveCount() const;

  void CloseAll();

private:
  struct ActiveConnection;

  std::shared_ptr<ActiveConnection> Find(const std::string& device_id) const;

  config::NetworkConfig config_;
  core::logging::Logger logger_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<ActiveConnection>> pool_;
};

core::json::Value ToJson(const ConnectionSnapshot& connection);
core::json::Value ToJson(const PingResult& ping);

} // namespace hwbridge::network
