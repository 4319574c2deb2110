#include "../common/assertions.hpp"
#include "devices/device_registry.hpp"
#include "network/network_manager.hpp"
#include "sessions/loopback_channel.hpp"
#include "sessions/session_manager.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using hwbridge::devices::DeviceType;
using hwbridge::sessions::SessionError;
using hwbridge::sessions::SessionErrorKind;

std::string AsText(const hwbridge::core::Bytes& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

} // namespace

int main() {
  using hwbridge::tests::common::Fail;

  std::ostringstream log_sink;
  const hwbridge::core::logging::Logger logger(hwbridge::core::logging::LogLevel::kDebug,
                                               log_sink);

  hwbridge::devices::DeviceRegistry registry(nullptr, logger.Child("registry"));
  hwbridge::network::NetworkManager network(hwbridge::config::NetworkConfig{},
                                            logger.Child("network"));

  std::atomic<hwbridge::sessions::LoopbackChannel*> last_channel{nullptr};
  hwbridge::sessions::SessionManager sessions(
      registry, network, logger.Child("sessions"),
      [&last_channel](const hwbridge::devices::DeviceInfo&,
                      const hwbridge::sessions::SerialConfig*) {
        auto channel = std::make_unique<hwbridge::sessions::LoopbackChannel>();
        last_channel = channel.get();
        return std::unique_ptr<hwbridge::sessions::IDeviceChannel>(std::move(channel));
      });

  // Concurrent opens of one port: exactly one wins, the rest see a conflict.
  {
    std::atomic<int> opened{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
      threads.emplace_back([&]() {
        hwbridge::sessions::DeviceConnection connection;
        SessionError error;
        if (sessions.OpenSerial("serial_com1", {}, connection, error)) {
          ++opened;
        } else if (error.kind == SessionErrorKind::kConflict) {
          ++conflicts;
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    if (opened != 1 || conflicts != 7) {
      Fail("expected exactly one concurrent serial open to win");
    }
  }

  // Registry reads overlay the live session.
  hwbridge::devices::DeviceInfo device;
  std::string lookup_error;
  if (!registry.Get("serial_com1", device, lookup_error) || !device.is_connected) {
    Fail("expected registry to report the open serial session");
  }

  // Loopback echoes what was written.
  SessionError error;
  std::size_t written = 0;
  const std::string payload = "PING\r\n";
  if (!sessions.Send("serial_com1", DeviceType::kSerial,
                     hwbridge::core::Bytes(payload.begin(), payload.end()), written, error) ||
      written != payload.size()) {
    Fail("serial send failed: " + error.message);
  }
  hwbridge::sessions::ReceiveOutcome outcome;
  if (!sessions.Receive("serial_com1", DeviceType::kSerial, 64, std::chrono::milliseconds(200),
                        outcome, error) ||
      AsText(outcome.data) != payload) {
    Fail("expected loopback echo");
  }
  if (!sessions.Receive("serial_com1", DeviceType::kSerial, 64, std::chrono::milliseconds(50),
                        outcome, error) ||
      !outcome.timed_out) {
    Fail("expected a quiet port to time out without an error");
  }

  // Wrong namespace for an open device.
  if (sessions.Send("serial_com1", DeviceType::kNetwork, {}, written, error)) {
    Fail("expected type mismatch to be rejected");
  }

  // An I/O failure moves the session into the error state until closed.
  last_channel.load()->FailNextOperation("cable unplugged");
  if (sessions.Send("serial_com1", DeviceType::kSerial, {0x01}, written, error) ||
      error.kind != SessionErrorKind::kIo) {
    Fail("expected injected I/O failure");
  }
  const auto failed_status = sessions.GetStatus("serial_com1");
  if (failed_status.status != hwbridge::devices::DeviceStatus::kError ||
      failed_status.last_error.find("cable unplugged") == std::string::npos) {
    Fail("expected session to report the error state");
  }

  // Close is idempotent.
  if (!sessions.Close("serial_com1")) {
    Fail("expected first close to report an open session");
  }
  if (sessions.Close("serial_com1")) {
    Fail("expected second close to be a no-op");
  }
  if (sessions.GetStatus("serial_com1").is_connected) {
    Fail("expected closed session to report disconnected");
  }

  // Opening something that is not a serial port.
  hwbridge::sessions::DeviceConnection connection;
  if (sessions.OpenSerial("printer_test1", {}, connection, error) ||
      error.kind != SessionErrorKind::kUnsupported) {
    Fail("expected serial open of a printer to be unsupported");
  }
  if (sessions.OpenSerial("no-such-device", {}, connection, error) ||
      error.kind != SessionErrorKind::kNotFound) {
    Fail("expected unknown device to be not found");
  }
  hwbridge::sessions::SerialConfig odd_baud;
  odd_baud.baud_rate = 1234;
  if (sessions.OpenSerial("serial_com1", odd_baud, connection, error) ||
      error.kind != SessionErrorKind::kValidation) {
    Fail("expected unsupported baud rate to fail validation");
  }

  // HID report ids travel as the first wire byte.
  if (!sessions.OpenUsb("usbhid_1234_5678", connection, error)) {
    Fail("usb open failed: " + error.message);
  }
  if (!sessions.SendReport("usbhid_1234_5678", 7, {0xAA, 0xBB}, written, error)) {
    Fail("usb send report failed: " + error.message);
  }
  std::uint8_t report_id = 0;
  if (!sessions.ReceiveReport("usbhid_1234_5678", std::chrono::milliseconds(200), report_id,
                              outcome, error) ||
      report_id != 7U || outcome.data != hwbridge::core::Bytes{0xAA, 0xBB}) {
    Fail("expected the echoed report with its id stripped");
  }
  if (sessions.SendReport("usbhid_1234_5678", 0, hwbridge::core::Bytes(200, 0x00), written,
                          error)) {
    Fail("expected oversized report to be rejected");
  }

  // Closing through another namespace leaves the session alone.
  if (sessions.Close("usbhid_1234_5678", DeviceType::kSerial) ||
      sessions.Close("usbhid_1234_5678", DeviceType::kNetwork)) {
    Fail("expected serial and network close of a USB session to be a no-op");
  }
  if (!sessions.GetStatus("usbhid_1234_5678").is_connected ||
      !sessions.SendReport("usbhid_1234_5678", 1, {0x01}, written, error)) {
    Fail("expected the USB session to survive a mismatched close");
  }
  if (!sessions.Close("usbhid_1234_5678", DeviceType::kUsbHid)) {
    Fail("expected usb close to close the USB session");
  }

  // Network sessions: same endpoint reuses, a different endpoint conflicts.
  boost::asio::io_context io;
  boost::asio::ip::tcp::acceptor acceptor(
      io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const std::uint16_t port = acceptor.local_endpoint().port();

  hwbridge::network::ConnectResult connect;
  if (!sessions.OpenNetwork("lan-1", "127.0.0.1", port, "tcp", std::nullopt, connect, error) ||
      !connect.success || connect.status != "connected") {
    Fail("expected network session to connect: " + connect.error);
  }
  if (!sessions.OpenNetwork("lan-1", "127.0.0.1", port, "tcp", std::nullopt, connect, error) ||
      connect.status != "already_connected") {
    Fail("expected same endpoint to report already_connected");
  }
  if (sessions.OpenNetwork("lan-1", "127.0.0.1", static_cast<std::uint16_t>(port + 1), "tcp",
                           std::nullopt, connect, error) ||
      error.kind != SessionErrorKind::kConflict) {
    Fail("expected a different endpoint to conflict");
  }
  if (hwbridge::sessions::ToRpcCode(SessionErrorKind::kConflict) != 1003) {
    Fail("expected conflicts to map to 1003");
  }

  // Dial failures are results, not errors, and leave no session behind.
  acceptor.close();
  if (!sessions.OpenNetwork("lan-2", "127.0.0.1", port, "tcp", std::chrono::milliseconds(500),
                            connect, error) ||
      connect.success) {
    Fail("expected dial to a closed port to fail softly");
  }
  if (sessions.GetStatus("lan-2").is_connected) {
    Fail("expected failed dial to leave no session");
  }

  sessions.CloseAll();
  if (sessions.OpenCount() != 0U || network.ActiveCount() != 0U) {
    Fail("expected CloseAll to release every session");
  }

  hwbridge::tests::common::AssertContains(log_sink.str(), "serial session opened");
  return 0;
}
