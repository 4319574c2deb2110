#include "devices/device_registry.hpp"
#include "network/network_manager.hpp"
#include "sessions/posix_serial_channel.hpp"
#include "sessions/session_manager.hpp"
#include "sessions/wakeable_fd.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <future>
#include <memory>
#include <poll.h>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>

using hwbridge::sessions::WakeableFd;

namespace {

constexpr auto kLongWait = std::chrono::milliseconds(10000);
constexpr auto kPromptly = std::chrono::milliseconds(5000);

hwbridge::core::logging::Logger QuietLogger() {
  static std::ostringstream sink;
  return hwbridge::core::logging::Logger(hwbridge::core::logging::LogLevel::kError, sink);
}

// Pseudo-terminal pair; the slave path stands in for a serial port.
struct PtyPair {
  PtyPair() {
    master = ::posix_openpt(O_RDWR | O_NOCTTY);
    REQUIRE(master >= 0);
    REQUIRE(::grantpt(master) == 0);
    REQUIRE(::unlockpt(master) == 0);
    const char* name = ::ptsname(master);
    REQUIRE(name != nullptr);
    slave_path = name;
  }
  ~PtyPair() {
    if (master >= 0) {
      ::close(master);
    }
  }

  int master = -1;
  std::string slave_path;
};

} // namespace

TEST_CASE("Close wakes a waiter and closes the descriptor after it leaves",
          "[sessions][wakeable]") {
  int pipe_fds[2] = {-1, -1};
  REQUIRE(::pipe(pipe_fds) == 0);
  WakeableFd fd;
  std::string error;
  REQUIRE(fd.Adopt(pipe_fds[0], error));

  auto waiter = std::async(std::launch::async, [&fd]() {
    const auto lock = fd.LockReader();
    short revents = 0;
    return fd.Wait(POLLIN, kLongWait, revents);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  const auto started = std::chrono::steady_clock::now();
  fd.Close();
  REQUIRE(std::chrono::steady_clock::now() - started < kPromptly);
  REQUIRE(waiter.wait_for(kPromptly) == std::future_status::ready);
  REQUIRE(waiter.get() == WakeableFd::WaitResult::kClosed);

  {
    const auto lock = fd.LockReader();
    REQUIRE_FALSE(fd.IsOpen());
    short revents = 0;
    REQUIRE(fd.Wait(POLLIN, std::chrono::milliseconds(0), revents) ==
            WakeableFd::WaitResult::kClosed);
  }
  // Idempotent.
  fd.Close();
  ::close(pipe_fds[1]);
}

TEST_CASE("Readable data is reported before any close", "[sessions][wakeable]") {
  int pipe_fds[2] = {-1, -1};
  REQUIRE(::pipe(pipe_fds) == 0);
  WakeableFd fd;
  std::string error;
  REQUIRE(fd.Adopt(pipe_fds[0], error));
  REQUIRE(::write(pipe_fds[1], "x", 1) == 1);

  const auto lock = fd.LockReader();
  short revents = 0;
  REQUIRE(fd.Wait(POLLIN, kLongWait, revents) == WakeableFd::WaitResult::kReady);
  REQUIRE((revents & POLLIN) != 0);
  ::close(pipe_fds[1]);
}

TEST_CASE("Serial read blocked on a quiet port fails promptly when closed",
          "[sessions][wakeable]") {
  PtyPair pty;
  hwbridge::sessions::PosixSerialChannel channel(pty.slave_path, {});
  std::string error;
  REQUIRE(channel.Open(error));

  REQUIRE(::write(pty.master, "hi", 2) == 2);
  hwbridge::core::Bytes data;
  REQUIRE(channel.Read(16, kLongWait, data, error));
  REQUIRE(std::string(data.begin(), data.end()) == "hi");

  auto reader = std::async(std::launch::async, [&channel]() {
    hwbridge::core::Bytes bytes;
    std::string read_error;
    const bool ok = channel.Read(16, kLongWait, bytes, read_error);
    return std::make_pair(ok, read_error);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  channel.Close();

  REQUIRE(reader.wait_for(kPromptly) == std::future_status::ready);
  const auto [ok, read_error] = reader.get();
  REQUIRE_FALSE(ok);
  REQUIRE(read_error == "serial port is closed");

  std::size_t written = 0;
  REQUIRE_FALSE(channel.Write({0x01}, written, error));
  REQUIRE(error == "serial port is closed");
}

TEST_CASE("Closing a serial session ends a receive that is waiting on the port",
          "[sessions][wakeable]") {
  PtyPair pty;
  hwbridge::devices::DeviceRegistry registry(nullptr, QuietLogger());
  hwbridge::network::NetworkManager network(hwbridge::config::NetworkConfig{}, QuietLogger());
  const std::string slave_path = pty.slave_path;
  hwbridge::sessions::SessionManager sessions(
      registry, network, QuietLogger(),
      [slave_path](const hwbridge::devices::DeviceInfo&,
                   const hwbridge::sessions::SerialConfig* serial) {
        return std::unique_ptr<hwbridge::sessions::IDeviceChannel>(
            std::make_unique<hwbridge::sessions::PosixSerialChannel>(
                slave_path, serial != nullptr ? *serial : hwbridge::sessions::SerialConfig{}));
      });

  hwbridge::sessions::DeviceConnection connection;
  hwbridge::sessions::SessionError error;
  REQUIRE(sessions.OpenSerial("serial_com1", {}, connection, error));

  auto receiver = std::async(std::launch::async, [&sessions]() {
    hwbridge::sessions::ReceiveOutcome outcome;
    hwbridge::sessions::SessionError receive_error;
    const bool ok = sessions.Receive("serial_com1", hwbridge::devices::DeviceType::kSerial, 16,
                                     kLongWait, outcome, receive_error);
    return std::make_pair(ok, receive_error);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  const auto started = std::chrono::steady_clock::now();
  REQUIRE(sessions.Close("serial_com1"));
  REQUIRE(std::chrono::steady_clock::now() - started < kPromptly);
  REQUIRE(receiver.wait_for(kPromptly) == std::future_status::ready);
  const auto [ok, receive_error] = receiver.get();
  REQUIRE_FALSE(ok);
  REQUIRE(receive_error.kind == hwbridge::sessions::SessionErrorKind::kIo);
  REQUIRE(sessions.OpenCount() == 0U);
}
