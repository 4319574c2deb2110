#pragma once

#include "core/json_dom.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hwbridge::devices {

enum class DeviceType {
  kPrinter,
  kSerial,
  kUsbHid,
  kNetwork,
  kBiometric,
};

enum class DeviceStatus {
  kAvailable,
  kConnected,
  kError,
};

// Capability details. A device carries one detail per capability it has, so a
// network printer holds both a PrinterDetail and a NetworkDetail.
struct PrinterDetail {
  std::vector<std::string> supported_protocols = {"ESC/POS", "ZPL", "EPL"};
  std::uint32_t max_print_width = 576;
  bool supports_color = false;
  bool supports_duplex = false;
  std::uint32_t max_resolution = 300;
  std::uint64_t max_job_size = 10U * 1024U * 1024U;
  // Character device for directly attached printers (e.g. /dev/usb/lp0).
  std::string device_path;
};

struct SerialDetail {
  std::string port_name;
  std::string device_path;
  std::vector<std::uint32_t> supported_baud_rates = {9600, 19200, 38400, 57600, 115200};
  std::uint32_t default_baud_rate = 9600;
};

struct UsbHidDetail {
  std::uint16_t vendor_id = 0;
  std::uint16_t product_id = 0;
  std::string device_path;
  std::uint16_t input_report_length = 64;
  std::uint16_t output_report_length = 64;
  std::uint16_t feature_report_length = 0;
};

struct NetworkDetail {
  std::string host;
  std::uint16_t port = 0;
  std::string protocol = "tcp";
};

struct BiometricDetail {
  std::uint32_t max_users = 1000;
  std::vector<std::string> supported_modes = {"verify", "identify", "enroll"};
};

using DeviceDetail =
    std::variant<PrinterDetail, SerialDetail, UsbHidDetail, NetworkDetail, BiometricDetail>;

// Canonical device record shared by the registry, sessions and RPC results.
struct DeviceInfo {
  std::string id;
  std::string name;
  DeviceType type = DeviceType::kSerial;
  DeviceStatus status = DeviceStatus::kAvailable;
  std::string manufacturer;
  std::string model;
  std::string serial_number;
  std::map<std::string, std::string> properties;
  std::chrono::system_clock::time_point last_seen{};
  bool is_connected = false;
  std::optional<std::string> connection_id;
  bool simulated = false;
  std::vector<DeviceDetail> details;

  template <typename Detail>
  const Detail* FindDetail() const {
    for (const auto& detail : details) {
      if (const auto* match = std::get_if<Detail>(&detail)) {
        return match;
      }
    }
    return nullptr;
  }
};

std::string ToString(DeviceType type);
std::string ToString(DeviceStatus status);
bool ParseDeviceType(std::string_view raw, DeviceType& type);

core::json::Value ToJson(const PrinterDetail& detail);
core::json::Value ToJson(const SerialDetail& detail);
core::json::Value ToJson(const UsbHidDetail& detail);
core::json::Value ToJson(const NetworkDetail& detail);
core::json::Value ToJson(const BiometricDetail& detail);

// Common fields plus one member per attached capability detail
// (`printer`, `serial`, `usbhid`, `network`, `biometric`).
core::json::Value ToJson(const DeviceInfo& device);

} // namespace hwbridge::devices
