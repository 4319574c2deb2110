#include "sessions/session_manager.hpp"

#include "core/errors/rpc_error.hpp"
#include "core/time_utils.hpp"
#include "core/uuid.hpp"
#include "sessions/hidraw_channel.hpp"
#include "sessions/loopback_channel.hpp"
#include "sessions/posix_serial_channel.hpp"

#include <atomic>

namespace hwbridge::sessions {

namespace {

using core::json::MakeBool;
using core::json::MakeNumber;
using core::json::MakeString;
using JsonValue = core::json::Value;

std::string DescribeType(devices::DeviceType type) {
  switch (type) {
  case devices::DeviceType::kSerial:
    return "serial";
  case devices::DeviceType::kUsbHid:
    return "USB HID";
  case devices::DeviceType::kNetwork:
    return "network";
  default:
    return devices::ToString(type);
  }
}

} // namespace

struct SessionManager::Session {
  // Guarded by SessionManager::mutex_.
  DeviceConnection record;
  bool opening = true;
  std::string last_error;

  // Written before the session is committed, read-only afterwards.
  std::unique_ptr<IDeviceChannel> channel;
  std::optional<SerialConfig> serial_config;
  std::string port_name;
  std::string host;
  std::uint16_t port = 0;
  std::size_t max_report_bytes = 64;

  std::mutex write_mutex;
  std::mutex read_mutex;
  std::atomic<std::uint64_t> bytes_written{0};
  std::atomic<std::uint64_t> bytes_read{0};
};

std::unique_ptr<IDeviceChannel> CreateDefaultChannel(const devices::DeviceInfo& device,
                                                     const SerialConfig* serial) {
  if (device.simulated) {
    return std::make_unique<LoopbackChannel>(true);
  }
  if (serial != nullptr) {
    const auto* detail = device.FindDetail<devices::SerialDetail>();
    if (detail == nullptr) {
      return nullptr;
    }
    const std::string path =
        detail->device_path.empty() ? "/dev/" + detail->port_name : detail->device_path;
    return std::make_unique<PosixSerialChannel>(path, *serial);
  }
  const auto* hid = device.FindDetail<devices::UsbHidDetail>();
  if (hid == nullptr || hid->device_path.empty()) {
    return nullptr;
  }
  return std::make_unique<HidrawChannel>(hid->device_path);
}

SessionManager::SessionManager(devices::DeviceRegistry& registry, network::NetworkManager& network,
                               core::logging::Logger logger, ChannelFactory channel_factory)
    : registry_(registry),
      network_(network),
      logger_(std::move(logger)),
      channel_factory_(std::move(channel_factory)) {
  registry_.SetSessionStateSource(this);
}

SessionManager::~SessionManager() {
  registry_.SetSessionStateSource(nullptr);
  CloseAll();
}

bool SessionManager::BeginOpen(const std::string& device_id, devices::DeviceType type,
                               std::shared_ptr<Session>& session, SessionError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(device_id);
  if (it != sessions_.end()) {
    error.kind = SessionErrorKind::kConflict;
    error.message = it->second->opening ? "Device " + device_id + " is already being opened"
                                        : "Device " + device_id + " is already open";
    return false;
  }

  session = std::make_shared<Session>();
  session->record.connection_id = core::GenerateUuid();
  session->record.device_id = device_id;
  session->record.device_type = type;
  sessions_.emplace(device_id, session);
  return true;
}

void SessionManager::AbortOpen(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(device_id);
  if (it != sessions_.end() && it->second->opening) {
    sessions_.erase(it);
  }
}

void SessionManager::CommitOpen(const std::shared_ptr<Session>& session,
                                DeviceConnection& opened) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = std::chrono::system_clock::now();
  session->record.connected_at = now;
  session->record.last_activity = now;
  session->record.status = devices::DeviceStatus::kConnected;
  session->opening = false;
  opened = session->record;
}

bool SessionManager::OpenSerial(const std::string& device_id, const SerialConfig& config,
                                DeviceConnection& opened, SessionError& error) {
  devices::DeviceInfo device;
  std::string lookup_error;
  if (!registry_.Get(device_id, device, lookup_error)) {
    error = {SessionErrorKind::kNotFound, lookup_error};
    return false;
  }
  const auto* detail = device.FindDetail<devices::SerialDetail>();
  if (device.type != devices::DeviceType::kSerial || detail == nullptr) {
    error = {SessionErrorKind::kUnsupported, "Device " + device_id + " is not a serial device"};
    return false;
  }
  std::string validation_error;
  if (!ValidateSerialConfig(config, *detail, validation_error)) {
    error = {SessionErrorKind::kValidation, validation_error};
    return false;
  }

  std::shared_ptr<Session> session;
  if (!BeginOpen(device_id, devices::DeviceType::kSerial, session, error)) {
    return false;
  }

  std::unique_ptr<IDeviceChannel> channel = channel_factory_(device, &config);
  if (channel == nullptr) {
    AbortOpen(device_id);
    error = {SessionErrorKind::kUnsupported,
             "No serial port backend available for device " + device_id};
    return false;
  }
  std::string open_error;
  if (!channel->Open(open_error)) {
    AbortOpen(device_id);
    error = {SessionErrorKind::kIo, "Failed to open " + detail->port_name + ": " + open_error};
    logger_.Warn("serial open failed", {{"device_id", device_id}, {"error", open_error}});
    return false;
  }

  session->channel = std::move(channel);
  session->serial_config = config;
  session->port_name = detail->port_name;
  session->record.metadata = {
      {"portName", detail->port_name},
      {"baudRate", std::to_string(config.baud_rate)},
      {"parity", ToString(config.parity)},
      {"dataBits", std::to_string(config.data_bits)},
      {"stopBits", ToString(config.stop_bits)},
  };
  CommitOpen(session, opened);
  logger_.Info("serial session opened",
               {{"device_id", device_id},
                {"port", detail->port_name},
                {"baud_rate", std::to_string(config.baud_rate)},
                {"connection_id", opened.connection_id}});
  return true;
}

bool SessionManager::OpenUsb(const std::string& device_id, DeviceConnection& opened,
                             SessionError& error) {
  devices::DeviceInfo device;
  std::string lookup_error;
  if (!registry_.Get(device_id, device, lookup_error)) {
    error = {SessionErrorKind::kNotFound, lookup_error};
    return false;
  }
  const auto* detail = device.FindDetail<devices::UsbHidDetail>();
  if (device.type != devices::DeviceType::kUsbHid || detail == nullptr) {
    error = {SessionErrorKind::kUnsupported, "Device " + device_id + " is not a USB HID device"};
    return false;
  }

  std::shared_ptr<Session> session;
  if (!BeginOpen(device_id, devices::DeviceType::kUsbHid, session, error)) {
    return false;
  }

  std::unique_ptr<IDeviceChannel> channel = channel_factory_(device, nullptr);
  if (channel == nullptr) {
    AbortOpen(device_id);
    error = {SessionErrorKind::kUnsupported,
             "No HID backend available for device " + device_id};
    return false;
  }
  std::string open_error;
  if (!channel->Open(open_error)) {
    AbortOpen(device_id);
    error = {SessionErrorKind::kIo, open_error};
    logger_.Warn("usb open failed", {{"device_id", device_id}, {"error", open_error}});
    return false;
  }

  session->channel = std::move(channel);
  session->max_report_bytes = detail->output_report_length == 0U
                                  ? 64U
                                  : static_cast<std::size_t>(detail->output_report_length);
  session->record.metadata = {
      {"vendorId", std::to_string(detail->vendor_id)},
      {"productId", std::to_string(detail->product_id)},
  };
  CommitOpen(session, opened);
  logger_.Info("usb session opened",
               {{"device_id", device_id}, {"connection_id", opened.connection_id}});
  return true;
}

bool SessionManager::OpenNetwork(const std::string& device_id, const std::string& host,
                                 std::uint16_t port, const std::string& protocol,
                                 std::optional<std::chrono::milliseconds> timeout,
                                 network::ConnectResult& result, SessionError& error) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(device_id);
    if (it != sessions_.end()) {
      const Session& existing = *it->second;
      if (existing.opening) {
        error = {SessionErrorKind::kConflict, "Device " + device_id + " is already being opened"};
        return false;
      }
      if (existing.record.device_type != devices::DeviceType::kNetwork) {
        error = {SessionErrorKind::kConflict,
                 "Device " + device_id + " has an open " +
                     DescribeType(existing.record.device_type) + " session"};
        return false;
      }
      if (existing.host != host || existing.port != port) {
        error = {SessionErrorKind::kConflict, "Device " + device_id + " is connected to " +
                                                  existing.host + ":" +
                                                  std::to_string(existing.port)};
        return false;
      }
      session = it->second;
    }
  }

  if (session != nullptr) {
    // Same endpoint: the pool answers already_connected, or redials a dead
    // socket in place.
    result = network_.Connect(device_id, host, port, protocol, timeout);
    if (result.success) {
      MarkActivity(session);
      std::lock_guard<std::mutex> lock(mutex_);
      session->record.status = devices::DeviceStatus::kConnected;
      session->last_error.clear();
    }
    return true;
  }

  if (!BeginOpen(device_id, devices::DeviceType::kNetwork, session, error)) {
    return false;
  }
  session->host = host;
  session->port = port;

  result = network_.Connect(device_id, host, port, protocol, timeout);
  if (!result.success) {
    AbortOpen(device_id);
    return true;
  }

  session->record.metadata = {
      {"host", host},
      {"port", std::to_string(port)},
      {"protocol", protocol},
  };
  DeviceConnection opened;
  CommitOpen(session, opened);
  logger_.Info("network session opened",
               {{"device_id", device_id},
                {"endpoint", host + ":" + std::to_string(port)},
                {"connection_id", opened.connection_id}});
  return true;
}

bool SessionManager::Close(const std::string& device_id,
                           std::optional<devices::DeviceType> expected_type) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(device_id);
    if (it == sessions_.end() || it->second->opening) {
      return false;
    }
    if (expected_type.has_value() && it->second->record.device_type != *expected_type) {
      logger_.Debug("close ignored for session of another type",
                    {{"device_id", device_id},
                     {"open_type", devices::ToString(it->second->record.device_type)},
                     {"requested_type", devices::ToString(*expected_type)}});
      return false;
    }
    session = it->second;
    sessions_.erase(it);
  }

  CloseTransport(device_id, *session);
  logger_.Info("session closed",
               {{"device_id", device_id},
                {"type", devices::ToString(session->record.device_type)},
                {"connection_id", session->record.connection_id}});
  return true;
}

void SessionManager::CloseTransport(const std::string& device_id, Session& session) {
  if (session.record.device_type == devices::DeviceType::kNetwork) {
    network_.Disconnect(device_id);
    return;
  }
  if (session.channel == nullptr) {
    return;
  }
  // In-flight reads and writes hold their own shared_ptr to the session. The
  // channel wakes them with a closed error; taking both locks afterwards
  // means no channel I/O is still running once Close returns.
  session.channel->Close();
  std::scoped_lock io_lock(session.write_mutex, session.read_mutex);
}

bool SessionManager::FindOpen(const std::string& device_id, devices::DeviceType expected_type,
                              std::shared_ptr<Session>& session, SessionError& error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(device_id);
  if (it == sessions_.end() || it->second->opening) {
    error = {SessionErrorKind::kNotConnected, "Device " + device_id + " is not connected"};
    return false;
  }
  if (it->second->record.device_type != expected_type) {
    error = {SessionErrorKind::kNotConnected,
             "Device " + device_id + " has no open " + DescribeType(expected_type) + " session"};
    return false;
  }
  if (it->second->record.status == devices::DeviceStatus::kError) {
    error = {SessionErrorKind::kIo, "Device " + device_id + " is in error state (" +
                                        it->second->last_error + "); close and reopen it"};
    return false;
  }
  session = it->second;
  return true;
}

void SessionManager::MarkActivity(const std::shared_ptr<Session>& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  session->record.last_activity = std::chrono::system_clock::now();
}

void SessionManager::MarkFailed(const std::shared_ptr<Session>& session,
                                const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session->record.status = devices::DeviceStatus::kError;
    session->last_error = reason;
  }
  logger_.Warn("session entered error state",
               {{"device_id", session->record.device_id}, {"error", reason}});
}

bool SessionManager::Send(const std::string& device_id, devices::DeviceType expected_type,
                          const core::Bytes& data, std::size_t& bytes_written,
                          SessionError& error) {
  bytes_written = 0;
  std::shared_ptr<Session> session;
  if (!FindOpen(device_id, expected_type, session, error)) {
    return false;
  }

  std::string io_error;
  bool ok = false;
  if (session->record.device_type == devices::DeviceType::kNetwork) {
    ok = network_.Send(device_id, data, bytes_written, io_error);
  } else {
    std::lock_guard<std::mutex> write_lock(session->write_mutex);
    ok = session->channel->Write(data, bytes_written, io_error);
  }
  if (!ok) {
    MarkFailed(session, io_error);
    error = {SessionErrorKind::kIo, io_error};
    return false;
  }

  session->bytes_written += bytes_written;
  MarkActivity(session);
  return true;
}

bool SessionManager::Receive(const std::string& device_id, devices::DeviceType expected_type,
                             std::size_t max_bytes, std::chrono::milliseconds timeout,
                             ReceiveOutcome& outcome, SessionError& error) {
  outcome = {};
  std::shared_ptr<Session> session;
  if (!FindOpen(device_id, expected_type, session, error)) {
    return false;
  }

  std::string io_error;
  bool ok = false;
  if (session->record.device_type == devices::DeviceType::kNetwork) {
    ok = network_.Receive(device_id, max_bytes, timeout, outcome.data, io_error);
  } else {
    std::lock_guard<std::mutex> read_lock(session->read_mutex);
    ok = session->channel->Read(max_bytes, timeout, outcome.data, io_error);
  }
  if (!ok) {
    MarkFailed(session, io_error);
    error = {SessionErrorKind::kIo, io_error};
    return false;
  }

  outcome.timed_out = outcome.data.empty();
  if (!outcome.timed_out) {
    session->bytes_read += outcome.data.size();
    MarkActivity(session);
  }
  return true;
}

bool SessionManager::SendReport(const std::string& device_id, std::uint8_t report_id,
                                const core::Bytes& data, std::size_t& bytes_written,
                                SessionError& error) {
  bytes_written = 0;
  std::shared_ptr<Session> session;
  if (!FindOpen(device_id, devices::DeviceType::kUsbHid, session, error)) {
    return false;
  }
  if (data.size() > session->max_report_bytes) {
    error = {SessionErrorKind::kValidation,
             "Report exceeds " + std::to_string(session->max_report_bytes) + " bytes"};
    return false;
  }

  core::Bytes frame;
  frame.reserve(data.size() + 1U);
  frame.push_back(report_id);
  frame.insert(frame.end(), data.begin(), data.end());

  std::size_t written = 0;
  std::string io_error;
  bool ok = false;
  {
    std::lock_guard<std::mutex> write_lock(session->write_mutex);
    ok = session->channel->Write(frame, written, io_error);
  }
  if (!ok) {
    MarkFailed(session, io_error);
    error = {SessionErrorKind::kIo, io_error};
    return false;
  }

  bytes_written = written > 0U ? written - 1U : 0U;
  session->bytes_written += bytes_written;
  MarkActivity(session);
  return true;
}

bool SessionManager::ReceiveReport(const std::string& device_id,
                                   std::chrono::milliseconds timeout, std::uint8_t& report_id,
                                   ReceiveOutcome& outcome, SessionError& error) {
  outcome = {};
  report_id = 0;
  std::shared_ptr<Session> session;
  if (!FindOpen(device_id, devices::DeviceType::kUsbHid, session, error)) {
    return false;
  }

  core::Bytes frame;
  std::string io_error;
  bool ok = false;
  {
    std::lock_guard<std::mutex> read_lock(session->read_mutex);
    ok = session->channel->Read(session->max_report_bytes + 1U, timeout, frame, io_error);
  }
  if (!ok) {
    MarkFailed(session, io_error);
    error = {SessionErrorKind::kIo, io_error};
    return false;
  }

  outcome.timed_out = frame.empty();
  if (!outcome.timed_out) {
    report_id = frame.front();
    outcome.data.assign(frame.begin() + 1, frame.end());
    session->bytes_read += outcome.data.size();
    MarkActivity(session);
  }
  return true;
}

SessionStatusReport SessionManager::GetStatus(const std::string& device_id) const {
  SessionStatusReport report;
  report.device_id = device_id;

  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(device_id);
    if (it == sessions_.end() || it->second->opening) {
      return report;
    }
    session = it->second;
    report.connection = session->record;
    report.status = session->record.status;
    report.is_connected = session->record.status == devices::DeviceStatus::kConnected;
    report.last_error = session->last_error;
  }

  report.serial_config = session->serial_config;
  report.port_name = session->port_name;
  if (session->record.device_type == devices::DeviceType::kNetwork) {
    if (const auto snapshot = network_.GetConnection(device_id)) {
      report.bytes_written = snapshot->bytes_written;
      report.bytes_read = snapshot->bytes_read;
    }
    return report;
  }
  if (session->channel != nullptr) {
    report.line_state = session->channel->QueryLineState();
  }
  report.bytes_written = session->bytes_written.load();
  report.bytes_read = session->bytes_read.load();
  return report;
}

std::vector<DeviceConnection> SessionManager::ListSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DeviceConnection> connections;
  connections.reserve(sessions_.size());
  for (const auto& [device_id, session] : sessions_) {
    if (!session->opening) {
      connections.push_back(session->record);
    }
  }
  return connections;
}

std::size_t SessionManager::OpenCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto& [device_id, session] : sessions_) {
    if (!session->opening) {
      ++count;
    }
  }
  return count;
}

std::optional<devices::SessionState> SessionManager::LookupSession(
    const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(device_id);
  if (it == sessions_.end() || it->second->opening) {
    return std::nullopt;
  }
  return devices::SessionState{
      .status = it->second->record.status,
      .connection_id = it->second->record.connection_id,
  };
}

void SessionManager::CloseAll() {
  std::map<std::string, std::shared_ptr<Session>> closing;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second->opening) {
        ++it;
        continue;
      }
      closing.insert(*it);
      it = sessions_.erase(it);
    }
  }
  for (const auto& [device_id, session] : closing) {
    CloseTransport(device_id, *session);
  }
  if (!closing.empty()) {
    logger_.Info("closed all sessions", {{"count", std::to_string(closing.size())}});
  }
}

int ToRpcCode(SessionErrorKind kind) {
  using core::errors::RpcErrorCode;
  switch (kind) {
  case SessionErrorKind::kNotFound:
    return core::errors::ToInt(RpcErrorCode::kDeviceNotFound);
  case SessionErrorKind::kValidation:
    return core::errors::ToInt(RpcErrorCode::kValidationFailed);
  case SessionErrorKind::kConflict:
    return core::errors::ToInt(RpcErrorCode::kDeviceBusy);
  case SessionErrorKind::kNotConnected:
    return core::errors::ToInt(RpcErrorCode::kDeviceNotConnected);
  case SessionErrorKind::kIo:
    return core::errors::ToInt(RpcErrorCode::kDeviceIoError);
  case SessionErrorKind::kUnsupported:
    return core::errors::ToInt(RpcErrorCode::kUnsupportedOperation);
  }
  return core::errors::ToInt(RpcErrorCode::kInternalError);
}

JsonValue ToJson(const DeviceConnection& connection) {
  JsonValue metadata = core::json::MakeObject();
  for (const auto& [key, value] : connection.metadata) {
    metadata.Set(key, MakeString(value));
  }

  JsonValue out = core::json::MakeObject();
  out.Set("connectionId", MakeString(connection.connection_id));
  out.Set("deviceId", MakeString(connection.device_id));
  out.Set("deviceType", MakeString(devices::ToString(connection.device_type)));
  out.Set("connectedAt", MakeString(core::FormatUtcTimestamp(connection.connected_at)));
  out.Set("lastActivity", MakeString(core::FormatUtcTimestamp(connection.last_activity)));
  out.Set("status", MakeString(devices::ToString(connection.status)));
  out.Set("metadata", std::move(metadata));
  return out;
}

JsonValue ToJson(const SessionStatusReport& report) {
  JsonValue out = core::json::MakeObject();
  out.Set("success", MakeBool(true));
  out.Set("deviceId", MakeString(report.device_id));
  out.Set("isConnected", MakeBool(report.is_connected));
  out.Set("status", MakeString(devices::ToString(report.status)));
  if (!report.connection.has_value()) {
    return out;
  }

  out.Set("connectionId", MakeString(report.connection->connection_id));
  out.Set("connectedAt", MakeString(core::FormatUtcTimestamp(report.connection->connected_at)));
  out.Set("lastActivity",
          MakeString(core::FormatUtcTimestamp(report.connection->last_activity)));
  out.Set("bytesWritten", MakeNumber(static_cast<double>(report.bytes_written)));
  out.Set("bytesRead", MakeNumber(static_cast<double>(report.bytes_read)));
  if (!report.last_error.empty()) {
    out.Set("lastError", MakeString(report.last_error));
  }

  if (report.serial_config.has_value()) {
    const SerialConfig& config = *report.serial_config;
    out.Set("portName", MakeString(report.port_name));
    out.Set("isOpen", MakeBool(report.status != devices::DeviceStatus::kAvailable));
    out.Set("baudRate", MakeNumber(config.baud_rate));
    out.Set("parity", MakeString(ToString(config.parity)));
    out.Set("dataBits", MakeNumber(config.data_bits));
    out.Set("stopBits", MakeString(ToString(config.stop_bits)));
    out.Set("flowControl", MakeString(ToString(config.flow_control)));
    out.Set("bytesToRead", MakeNumber(report.line_state.bytes_to_read));
    out.Set("bytesToWrite", MakeNumber(report.line_state.bytes_to_write));
    out.Set("ctsHolding", MakeBool(report.line_state.cts_holding));
    out.Set("dsrHolding", MakeBool(report.line_state.dsr_holding));
    out.Set("cdHolding", MakeBool(report.line_state.cd_holding));
  }
  return out;
}

} // namespace hwbridge::sessions
