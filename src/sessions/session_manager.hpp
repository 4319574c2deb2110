#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "core/payload_encoding.hpp"
#include "devices/device_info.hpp"
#include "devices/device_registry.hpp"
#include "network/network_manager.hpp"
#include "sessions/device_channel.hpp"
#include "sessions/serial_config.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hwbridge::sessions {

enum class SessionErrorKind {
  kNotFound,
  kValidation,
  kConflict,
  kNotConnected,
  kIo,
  kUnsupported,
};

struct SessionError {
  SessionErrorKind kind = SessionErrorKind::kIo;
  std::string message;
};

// One open device session. Owned by the SessionManager, never by the
// WebSocket connection that opened it.
struct DeviceConnection {
  std::string connection_id;
  std::string device_id;
  devices::DeviceType device_type = devices::DeviceType::kSerial;
  std::chrono::system_clock::time_point connected_at{};
  std::chrono::system_clock::time_point last_activity{};
  devices::DeviceStatus status = devices::DeviceStatus::kConnected;
  std::map<std::string, std::string> metadata;
};

struct ReceiveOutcome {
  core::Bytes data;
  // Nothing arrived before the deadline. Not an error.
  bool timed_out = false;
};

// getStatus result. Always produced, even for devices without a session.
struct SessionStatusReport {
  std::string device_id;
  bool is_connected = false;
  devices::DeviceStatus status = devices::DeviceStatus::kAvailable;
  std::optional<DeviceConnection> connection;
  std::optional<SerialConfig> serial_config;
  std::string port_name;
  LineState line_state;
  std::uint64_t bytes_written = 0;
  std::uint64_t bytes_read = 0;
  std::string last_error;
};

// Builds the channel behind a serial or USB session. `serial` is set for
// serial opens. Returning nullptr means the device cannot be opened this way.
using ChannelFactory = std::function<std::unique_ptr<IDeviceChannel>(
    const devices::DeviceInfo& device, const SerialConfig* serial)>;

// Simulated devices get a loopback channel, real serial ports a termios
// channel and real HID devices a hidraw channel.
std::unique_ptr<IDeviceChannel> CreateDefaultChannel(const devices::DeviceInfo& device,
                                                     const SerialConfig* serial);

// Per-device session table: AVAILABLE -> CONNECTED -> AVAILABLE, with ERROR
// entered on I/O failure and left only through Close.
//
// Locking:
// - mutex_ guards the table and every session record. It is never held across
//   device I/O, registry calls or network dials.
// - Open inserts a placeholder first, so concurrent opens of one device
//   serialize and exactly one wins.
// - Each session serializes its writers and its readers independently.
class SessionManager final : public devices::ISessionStateSource {
public:
  SessionManager(devices::DeviceRegistry& registry, network::NetworkManager& network,
                 core::logging::Logger logger, ChannelFactory channel_factory = CreateDefaultChannel);
  ~SessionManager() override;

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  bool OpenSerial(const std::string& device_id, const SerialConfig& config, DeviceConnection& opened,
                  SessionError& error);
  bool OpenUsb(const std::string& device_id, DeviceConnection& opened, SessionError& error);

  // Dial failures come back as `result.success == false` with the reason in
  // `result.error`; the return value is false only for table conflicts.
  bool OpenNetwork(const std::string& device_id, const std::string& host, std::uint16_t port,
                   const std::string& protocol, std::optional<std::chrono::milliseconds> timeout,
                   network::ConnectResult& result, SessionError& error);

  // Returns whether a session was open. Closing a closed device is a no-op,
  // and so is closing a session of a type other than `expected_type`.
  bool Close(const std::string& device_id,
             std::optional<devices::DeviceType> expected_type = std::nullopt);

  bool Send(const std::string& device_id, devices::DeviceType expected_type,
            const core::Bytes& data, std::size_t& bytes_written, SessionError& error);
  bool Receive(const std::string& device_id, devices::DeviceType expected_type,
               std::size_t max_bytes, std::chrono::milliseconds timeout, ReceiveOutcome& outcome,
               SessionError& error);

  // HID reports: the report id is prepended on the wire and stripped on read.
  bool SendReport(const std::string& device_id, std::uint8_t report_id, const core::Bytes& data,
                  std::size_t& bytes_written, SessionError& error);
  bool ReceiveReport(const std::string& device_id, std::chrono::milliseconds timeout,
                     std::uint8_t& report_id, ReceiveOutcome& outcome, SessionError& error);

  SessionStatusReport GetStatus(const std::string& device_id) const;
  std::vector<DeviceConnection> ListSessions() const;
  std::size_t OpenCount() const;

  std::optional<devices::SessionState> LookupSession(const std::string& device_id) const override;

  void CloseAll();

private:
  struct Session;

  bool BeginOpen(const std::string& device_id, devices::DeviceType type,
                 std::shared_ptr<Session>& session, SessionError& error);
  void AbortOpen(const std::string& device_id);
  void CloseTransport(const std::string& device_id, Session& session);
  void CommitOpen(const std::shared_ptr<Session>& session, DeviceConnection& opened);

  bool FindOpen(const std::string& device_id, devices::DeviceType expected_type,
                std::shared_ptr<Session>& session, SessionError& error) const;
  void MarkActivity(const std::shared_ptr<Session>& session);
  void MarkFailed(const std::shared_ptr<Session>& session, const std::string& reason);

  devices::DeviceRegistry& registry_;
  network::NetworkManager& network_;
  core::logging::Logger logger_;
  ChannelFactory channel_factory_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
};

int ToRpcCode(SessionErrorKind kind);

core::json::Value ToJson(const DeviceConnection& connection);
core::json::Value ToJson(const SessionStatusReport& report);

} // namespace hwbridge::sessions
