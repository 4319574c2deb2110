#include "network/network_manager.hpp"

#include "core/time_utils.hpp"
#include "network/tcp_probe.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>

namespace hwbridge::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct NetworkManager::ActiveConnection {
  ActiveConnection() : socket(io) {}

  asio::io_context io;
  tcp::socket socket;
  // Serialises I/O on this socket; never held together with the pool mutex.
  std::mutex io_mutex;
  ConnectionSnapshot info;
};

NetworkManager::NetworkManager(config::NetworkConfig config, core::logging::Logger logger)
    : config_(std::move(config)), logger_(std::move(logger)) {}

NetworkManager::~NetworkManager() {
  CloseAll();
}

std::shared_ptr<NetworkManager::ActiveConnection> NetworkManager::Find(
    const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = pool_.find(device_id);
  return it == pool_.end() ? nullptr : it->second;
}

ConnectResult NetworkManager::Connect(const std::string& device_id, const std::string& host,
                                      std::uint16_t port, const std::string& protocol,
                                      std::optional<std::chrono::milliseconds> timeout) {
  ConnectResult result;

  if (const auto existing = Find(device_id)) {
    std::lock_guard<std::mutex> io_lock(existing->io_mutex);
    if (existing->info.is_alive) {
      result.success = true;
      result.status = "already_connected";
      result.connection = existing->info;
      return result;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pool_.find(device_id);
    const bool replacing = it != pool_.end();
    if (!replacing && pool_.size() >= config_.max_connections) {
      result.error = "Connection pool exhausted (" + std::to_string(config_.max_connections) +
                     " connections)";
      return result;
    }
  }

  auto connection = std::make_shared<ActiveConnection>();
  const auto started = std::chrono::steady_clock::now();
  std::string error;
  if (!ConnectWithTimeout(connection->io, connection->socket, host, port,
                          timeout.value_or(config_.connect_timeout), error)) {
    result.error = "Failed to connect to " + host + ":" + std::to_string(port) + ": " + error;
    logger_.Warn("network connect failed", {{"device_id", device_id}, {"error", result.error}});
    return result;
  }
  result.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  boost::system::error_code option_ec;
  connection->socket.set_option(tcp::no_delay(true), option_ec);
  connection->socket.set_option(asio::socket_base::keep_alive(true), option_ec);

  const auto now = std::chrono::system_clock::now();
  connection->info = ConnectionSnapshot{
      .device_id = device_id,
      .host = host,
      .port = port,
      .protocol = protocol.empty() ? "tcp" : protocol,
      .connected_at = now,
      .last_activity = now,
      .is_alive = true,
  };

  std::shared_ptr<ActiveConnection> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = pool_[device_id];
    if (slot != nullptr) {
      std::lock_guard<std::mutex> io_lock(slot->io_mutex);
      if (slot->info.is_alive) {
        // Lost a race with a concurrent connect for the same device.
        boost::system::error_code ignored;
        connection->socket.close(ignored);
        result.success = true;
        result.status = "already_connected";
        result.connection = slot->info;
        return result;
      }
      replaced = slot;
    }
    slot = connection;
  }
  if (replaced != nullptr) {
    std::lock_guard<std::mutex> io_lock(replaced->io_mutex);
    boost::system::error_code ignored;
    replaced->socket.close(ignored);
  }

  logger_.Info("network device connected", {{"device_id", device_id},
                                            {"host", host},
                                            {"port", std::to_string(port)}});
  result.success = true;
  result.status = "connected";
  result.connection = connection->info;
  return result;
}

DisconnectResult NetworkManager::Disconnect(const std::string& device_id) {
  std::shared_ptr<ActiveConnection> connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pool_.find(device_id);
    if (it == pool_.end()) {
      return DisconnectResult{.success = true, .status = "not_connected"};
    }
    connection = it->second;
    pool_.erase(it);
  }

  std::lock_guard<std::mutex> io_lock(connection->io_mutex);
  boost::system::error_code ignored;
  connection->socket.shutdown(tcp::socket::shutdown_both, ignored);
  connection->socket.close(ignored);
  connection->info.is_alive = false;
  logger_.Info("network device disconnected", {{"device_id", device_id}});
  return DisconnectResult{.success = true, .status = "disconnected"};
}

bool NetworkManager::Send(const std::string& device_id, const core::Bytes& data,
                          std::size_t& bytes_written, std::string& error) {
  bytes_written = 0;
  const auto connection = Find(device_id);
  if (connection == nullptr) {
    error = "Device " + device_id + " is not connected";
    return false;
  }

  std::lock_guard<std::mutex> io_lock(connection->io_mutex);
  if (!connection->info.is_alive) {
    error = "Device " + device_id + " connection is not alive";
    return false;
  }

  connection->io.restart();
  std::optional<boost::system::error_code> write_result;
  std::size_t written = 0;
  asio::async_write(connection->socket, asio::buffer(data),
                    [&](const boost::system::error_code& ec, std::size_t n) {
                      write_result = ec;
                      written = n;
                    });
  connection->io.run_for(config_.connect_timeout);
  if (!write_result.has_value()) {
    boost::system::error_code ignored;
    connection->socket.cancel(ignored);
    connection->io.restart();
    connection->io.run();
    connection->info.is_alive = false;
    error = "write timed out for device " + device_id;
    return false;
  }
  if (*write_result) {
    connection->info.is_alive = false;
    error = "write failed for device " + device_id + ": " + write_result->message();
    logger_.Warn("network write failed", {{"device_id", device_id}, {"error", error}});
    return false;
  }

  bytes_written = written;
  connection->info.bytes_written += written;
  connection->info.last_activity = std::chrono::system_clock::now();
  return true;
}

bool NetworkManager::Receive(const std::string& device_id, std::size_t max_bytes,
                             std::chrono::milliseconds timeout, core::Bytes& data,
                             std::string& error) {
  data.clear();
  const auto connection = Find(device_id);
  if (connection == nullptr) {
    error = "Device " + device_id + " is not connected";
    return false;
  }

  std::lock_guard<std::mutex> io_lock(connection->io_mutex);
  if (!connection->info.is_alive) {
    error = "Device " + device_id + " connection is not alive";
    return false;
  }

  data.resize(max_bytes);
  connection->io.restart();
  std::optional<boost::system::error_code> read_result;
  std::size_t received = 0;
  connection->socket.async_read_some(asio::buffer(data),
                                     [&](const boost::system::error_code& ec, std::size_t n) {
                                       read_result = ec;
                                       received = n;
                                     });
  connection->io.run_for(timeout);
  if (!read_result.has_value()) {
    boost::system::error_code ignored;
    connection->socket.cancel(ignored);
    connection->io.restart();
    connection->io.run();
  }
  if (read_result.has_value() && *read_result &&
      *read_result != asio::error::operation_aborted) {
    data.clear();
    connection->info.is_alive = false;
    error = *read_result == asio::error::eof ? "connection closed by peer"
                                             : "read failed: " + read_result->message();
    return false;
  }

  data.resize(received);
  connection->info.bytes_read += received;
  if (received > 0U) {
    connection->info.last_activity = std::chrono::system_clock::now();
  }
  return true;
}

PingResult NetworkManager::Ping(const std::string& device_id, const std::string& host,
                                std::uint16_t port,
                                std::optional<std::chrono::milliseconds> timeout) const {
  const ProbeResult probe = ProbeTcp(host, port, timeout.value_or(config_.ping_timeout));
  PingResult result{
      .success = probe.reachable,
      .device_id = device_id,
      .host = host,
      .port = port,
      .response_time = probe.response_time,
      .is_online = probe.reachable,
      .timestamp = std::chrono::system_clock::now(),
      .error = probe.error,
  };
  logger_.Debug("network ping", {{"host", host},
                                 {"port", std::to_string(port)},
                                 {"online", probe.reachable ? "true" : "false"}});
  return result;
}

bool NetworkManager::SendOnce(const std::string& host, std::uint16_t port,
                              const core::Bytes& data, std::string& error) const {
  asio::io_context io;
  tcp::socket socket(io);
  if (!ConnectWithTimeout(io, socket, host, port, config_.connect_timeout, error)) {
    error = "Failed to connect to " + host + ":" + std::to_string(port) + ": " + error;
    return false;
  }

  boost::system::error_code ec;
  asio::write(socket, asio::buffer(data), ec);
  boost::system::error_code ignored;
  socket.shutdown(tcp::socket::shutdown_both, ignored);
  socket.close(ignored);
  if (ec) {
    error = "write to " + host + ":" + std::to_string(port) + " failed: " + ec.message();
    return false;
  }
  return true;
}

std::optional<ConnectionSnapshot> NetworkManager::GetConnection(
    const std::string& device_id) const {
  const auto connection = Find(device_id);
  if (connection == nullptr) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> io_lock(connection->io_mutex);
  return connection->info;
}

std::vector<ConnectionSnapshot> NetworkManager::ListConnections() const {
  std::vector<std::shared_ptr<ActiveConnection>> connections;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, connection] : pool_) {
      (void)id;
      connections.push_back(connection);
    }
  }
  std::vector<ConnectionSnapshot> snapshots;
  snapshots.reserve(connections.size());
  for (const auto& connection : connections) {
    std::lock_guard<std::mutex> io_lock(connection->io_mutex);
    snapshots.push_back(connection->info);
  }
  return snapshots;
}

std::size_t NetworkManager::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pool_.size();
}

void NetworkManager::CloseAll() {
  std::map<std::string, std::shared_ptr<ActiveConnection>> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(pool_);
  }
  for (auto& [id, connection] : drained) {
    (void)id;
    std::lock_guard<std::mutex> io_lock(connection->io_mutex);
    boost::system::error_code ignored;
    connection->socket.close(ignored);
    connection->info.is_alive = false;
  }
}

core::json::Value ToJson(const ConnectionSnapshot& connection) {
  core::json::Value out = core::json::MakeObject();
  out.Set("deviceId", core::json::MakeString(connection.device_id));
  out.Set("host", core::json::MakeString(connection.host));
  out.Set("port", core::json::MakeNumber(connection.port));
  out.Set("protocol", core::json::MakeString(connection.protocol));
  out.Set("connectedAt", core::json::MakeString(core::FormatUtcTimestamp(connection.connected_at)));
  out.Set("lastActivity",
          core::json::MakeString(core::FormatUtcTimestamp(connection.last_activity)));
  out.Set("bytesWritten", core::json::MakeNumber(static_cast<double>(connection.bytes_written)));
  out.Set("bytesRead", core::json::MakeNumber(static_cast<double>(connection.bytes_read)));
  out.Set("isAlive", core::json::MakeBool(connection.is_alive));
  return out;
}

core::json::Value ToJson(const PingResult& ping) {
  core::json::Value out = core::json::MakeObject();
  out.Set("success", core::json::MakeBool(ping.success));
  out.Set("deviceId", core::json::MakeString(ping.device_id));
  out.Set("host", core::json::MakeString(ping.host));
  out.Set("port", core::json::MakeNumber(ping.port));
  out.Set("responseTime", core::json::MakeNumber(static_cast<double>(ping.response_time.count())));
  out.Set("isOnline", core::json::MakeBool(ping.is_online));
  out.Set("timestamp", core::json::MakeString(core::FormatUtcTimestamp(ping.timestamp)));
  if (!ping.error.empty()) {
    out.Set("error", core::json::MakeString(ping.error));
  }
  return out;
}

} // namespace hwbridge::network
