#include "devices/device_event.hpp"
#include "devices/device_registry.hpp"
#include "devices/device_watcher.hpp"
#include "devices/fixture_enumerator.hpp"

#include <boost/asio/thread_pool.hpp>
#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>

#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using hwbridge::devices::DeviceEventType;
using hwbridge::devices::DeviceInfo;
using hwbridge::devices::DeviceStatus;
using hwbridge::devices::DeviceType;

namespace {

DeviceInfo MakeDevice(const std::string& id, bool connected = false,
                      DeviceStatus status = DeviceStatus::kAvailable) {
  DeviceInfo device;
  device.id = id;
  device.name = id;
  device.is_connected = connected;
  device.status = status;
  return device;
}

class FailingEnumerator final : public hwbridge::devices::IDeviceEnumerator {
public:
  bool Enumerate(std::vector<DeviceInfo>&, std::string& error) override {
    error = "enumeration tool missing";
    return false;
  }
  std::string_view Name() const override {
    return "failing";
  }
};

class ScriptedEnumerator final : public hwbridge::devices::IDeviceEnumerator {
public:
  explicit ScriptedEnumerator(std::vector<std::vector<DeviceInfo>>* snapshots)
      : snapshots_(snapshots) {}

  bool Enumerate(std::vector<DeviceInfo>& devices, std::string&) override {
    devices = snapshots_->front();
    if (snapshots_->size() > 1U) {
      snapshots_->erase(snapshots_->begin());
    }
    return true;
  }
  std::string_view Name() const override {
    return "scripted";
  }

private:
  std::vector<std::vector<DeviceInfo>>* snapshots_;
};

hwbridge::core::logging::Logger QuietLogger() {
  static std::ostringstream sink;
  return hwbridge::core::logging::Logger(hwbridge::core::logging::LogLevel::kError, sink);
}

} // namespace

TEST_CASE("Diff reports removals first then additions and changes by id", "[devices][diff]") {
  const std::vector<DeviceInfo> before = {MakeDevice("b"), MakeDevice("c"),
                                          MakeDevice("d", false, DeviceStatus::kAvailable)};
  const std::vector<DeviceInfo> after = {MakeDevice("a"), MakeDevice("c", true),
                                         MakeDevice("d", false, DeviceStatus::kError)};

  const auto events = hwbridge::devices::DiffDeviceSets(before, after);
  REQUIRE(events.size() == 4U);
  REQUIRE(events[0].type == DeviceEventType::kRemoved);
  REQUIRE(events[0].device_id == "b");
  REQUIRE_FALSE(events[0].device.has_value());
  REQUIRE(events[1].type == DeviceEventType::kDiscovered);
  REQUIRE(events[1].device_id == "a");
  REQUIRE(events[2].type == DeviceEventType::kConnected);
  REQUIRE(events[2].device_id == "c");
  REQUIRE(events[3].type == DeviceEventType::kStatusChanged);
  REQUIRE(events[3].device_id == "d");
}

TEST_CASE("Identical snapshots produce no events", "[devices][diff]") {
  const std::vector<DeviceInfo> snapshot = {MakeDevice("a"), MakeDevice("b", true)};
  REQUIRE(hwbridge::devices::DiffDeviceSets(snapshot, snapshot).empty());
}

TEST_CASE("Fixture rows map endpoints onto capability details", "[devices][fixture]") {
  DeviceInfo device;
  std::string error;
  REQUIRE(hwbridge::devices::ParseDeviceFixtureLine(
      "usbhid,scanner-1,Scanner,Acme,S1,SN1,0c2e:0b61@/dev/hidraw3", 2, device, error));
  REQUIRE(device.type == DeviceType::kUsbHid);
  const auto* hid = device.FindDetail<hwbridge::devices::UsbHidDetail>();
  REQUIRE(hid != nullptr);
  REQUIRE(hid->vendor_id == 0x0c2e);
  REQUIRE(hid->product_id == 0x0b61);
  REQUIRE(hid->device_path == "/dev/hidraw3");

  REQUIRE(hwbridge::devices::ParseDeviceFixtureLine(
      "printer,lan-printer,Front Desk,Epson,TM-T88,SN2,10.0.0.5:9100", 3, device, error));
  REQUIRE(device.FindDetail<hwbridge::devices::PrinterDetail>() != nullptr);
  const auto* network = device.FindDetail<hwbridge::devices::NetworkDetail>();
  REQUIRE(network != nullptr);
  REQUIRE(network->host == "10.0.0.5");
  REQUIRE(network->port == 9100);
}

TEST_CASE("Fixture rows with bad shapes name the line", "[devices][fixture]") {
  DeviceInfo device;
  std::string error;
  REQUIRE_FALSE(hwbridge::devices::ParseDeviceFixtureLine("serial,only-two", 7, device, error));
  REQUIRE(error.find("line 7") != std::string::npos);

  REQUIRE_FALSE(
      hwbridge::devices::ParseDeviceFixtureLine("camera,c1,Cam,,,,/dev/video0", 8, device, error));
  REQUIRE(error.find("unknown device type") != std::string::npos);

  REQUIRE_FALSE(
      hwbridge::devices::ParseDeviceFixtureLine("network,n1,Box,,,,no-port", 9, device, error));
}

TEST_CASE("Registry falls back to simulated devices", "[devices][registry]") {
  SECTION("no enumerator configured") {
    hwbridge::devices::DeviceRegistry registry(nullptr, QuietLogger());
    const auto result = registry.Enumerate(false);
    REQUIRE(result.source == hwbridge::devices::kSourceSimulated);
    REQUIRE_FALSE(result.devices.empty());
  }
  SECTION("enumerator fails") {
    hwbridge::devices::DeviceRegistry registry(std::make_unique<FailingEnumerator>(),
                                               QuietLogger());
    const auto result = registry.Enumerate(true);
    REQUIRE(result.source == hwbridge::devices::kSourceSimulated);
    DeviceInfo device;
    std::string error;
    REQUIRE(registry.Get("printer_test1", device, error));
    REQUIRE(device.simulated);
    REQUIRE_FALSE(registry.Get("missing", device, error));
  }
}

TEST_CASE("Registry refresh yields changes since the last refresh", "[devices][registry]") {
  std::vector<std::vector<DeviceInfo>> snapshots = {
      {MakeDevice("a")},
      {MakeDevice("a")},
      {MakeDevice("a"), MakeDevice("b")},
  };
  hwbridge::devices::DeviceRegistry registry(std::make_unique<ScriptedEnumerator>(&snapshots),
                                             QuietLogger());
  const auto first = registry.Enumerate(true);
  REQUIRE(first.source == hwbridge::devices::kSourceReal);
  REQUIRE(first.devices.size() == 1U);

  registry.Refresh();
  const auto events = registry.Refresh();
  REQUIRE(events.size() == 1U);
  REQUIRE(events.front().type == DeviceEventType::kDiscovered);
  REQUIRE(events.front().device_id == "b");

  registry.Watch("conn-1");
  REQUIRE(registry.IsWatching("conn-1"));
  registry.Unwatch("conn-1");
  REQUIRE(registry.WatchingConnections().empty());
}

TEST_CASE("Watcher survives restarts while ticks run on other threads", "[devices][watcher]") {
  hwbridge::devices::DeviceRegistry registry(nullptr, QuietLogger());
  registry.Watch("conn-1");
  std::atomic<int> delivered{0};
  boost::asio::thread_pool pool(2);
  hwbridge::devices::DeviceWatcher watcher(
      pool.get_executor(), registry, std::chrono::milliseconds(1),
      [&delivered](const std::vector<std::string>&, const hwbridge::devices::DeviceEvent&) {
        ++delivered;
      },
      QuietLogger());

  for (int round = 0; round < 200; ++round) {
    watcher.Start();
    watcher.Stop();
  }
  watcher.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  watcher.Stop();
  pool.join();

  // The simulated set never changes, so the loop has nothing to report.
  REQUIRE(delivered == 0);
  REQUIRE(registry.IsWatching("conn-1"));
}
