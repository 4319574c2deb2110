#include "devices/fixture_enumerator.hpp"

#include "core/string_utils.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace hwbridge::devices {

namespace {

std::string LineError(std::size_t line_number, std::string_view message) {
  return "device fixture parse error at line " + std::to_string(line_number) + ": " +
         std::string(message);
}

bool ParseHostPort(std::string_view endpoint, std::string& host, std::uint16_t& port) {
  const std::size_t colon = endpoint.rfind(':');
  if (colon == std::string_view::npos || colon == 0U || colon + 1U >= endpoint.size()) {
    return false;
  }
  unsigned parsed = 0;
  const std::string_view port_text = endpoint.substr(colon + 1U);
  const auto [ptr, ec] =
      std::from_chars(port_text.data(), port_text.data() + port_text.size(), parsed);
  if (ec != std::errc() || ptr != port_text.data() + port_text.size() || parsed == 0U ||
      parsed > 65535U) {
    return false;
  }
  host = std::string(endpoint.substr(0, colon));
  port = static_cast<std::uint16_t>(parsed);
  return true;
}

bool ParseHex16(std::string_view text, std::uint16_t& value) {
  if (text.rfind("0x", 0) == 0U || text.rfind("0X", 0) == 0U) {
    text.remove_prefix(2);
  }
  unsigned parsed = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed, 16);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size() || parsed > 0xFFFFU) {
    return false;
  }
  value = static_cast<std::uint16_t>(parsed);
  return true;
}

bool ParseUsbEndpoint(std::string_view endpoint, UsbHidDetail& detail) {
  const std::size_t at = endpoint.find('@');
  const std::string_view ids = endpoint.substr(0, at);
  const std::size_t colon = ids.find(':');
  if (colon == std::string_view::npos) {
    return false;
  }
  if (!ParseHex16(ids.substr(0, colon), detail.vendor_id) ||
      !ParseHex16(ids.substr(colon + 1U), detail.product_id)) {
    return false;
  }
  if (at != std::string_view::npos) {
    detail.device_path = std::string(endpoint.substr(at + 1U));
  }
  return true;
}

bool LooksLikeHeader(const std::vector<std::string>& fields) {
  return core::ToLower(fields[0]) == "type" && core::ToLower(fields[1]) == "id";
}

} // namespace

FixtureDeviceEnumerator::FixtureDeviceEnumerator(fs::path fixture_path)
    : fixture_path_(std::move(fixture_path)) {}

bool ParseDeviceFixtureLine(const std::string& line, const std::size_t line_number,
                            DeviceInfo& device, std::string& error) {
  const std::vector<std::string> fields = core::SplitTrimmed(line, ',');
  if (fields.size() < 7U) {
    error = LineError(line_number,
                      "expected 7 CSV fields "
                      "(type,id,name,manufacturer,model,serialNumber,endpoint)");
    return false;
  }

  device = DeviceInfo{};
  if (!ParseDeviceType(fields[0], device.type)) {
    error = LineError(line_number, "unknown device type '" + fields[0] + "'");
    return false;
  }
  if (fields[1].empty()) {
    error = LineError(line_number, "device id must not be empty");
    return false;
  }

  device.id = fields[1];
  device.name = fields[2].empty() ? fields[1] : fields[2];
  device.manufacturer = fields[3];
  device.model = fields[4];
  device.serial_number = fields[5];
  device.last_seen = std::chrono::system_clock::now();
  const std::string& endpoint = fields[6];

  switch (device.type) {
  case DeviceType::kSerial: {
    if (endpoint.empty()) {
      error = LineError(line_number, "serial device requires a device node endpoint");
      return false;
    }
    SerialDetail detail;
    detail.device_path = endpoint;
    detail.port_name = fs::path(endpoint).filename().string();
    device.details.emplace_back(std::move(detail));
    break;
  }
  case DeviceType::kUsbHid: {
    UsbHidDetail detail;
    if (!ParseUsbEndpoint(endpoint, detail)) {
      error = LineError(line_number, "usbhid endpoint must be vid:pid[@node] in hex");
      return false;
    }
    device.details.emplace_back(std::move(detail));
    break;
  }
  case DeviceType::kNetwork: {
    NetworkDetail detail;
    if (!ParseHostPort(endpoint, detail.host, detail.port)) {
      error = LineError(line_number, "network endpoint must be host:port");
      return false;
    }
    device.details.emplace_back(std::move(detail));
    break;
  }
  case DeviceType::kPrinter: {
    PrinterDetail printer;
    NetworkDetail network;
    if (ParseHostPort(endpoint, network.host, network.port)) {
      device.details.emplace_back(std::move(printer));
      device.details.emplace_back(std::move(network));
    } else {
      printer.device_path = endpoint;
      device.details.emplace_back(std::move(printer));
    }
    break;
  }
  case DeviceType::kBiometric: {
    device.details.emplace_back(BiometricDetail{});
    NetworkDetail network;
    if (!endpoint.empty() && ParseHostPort(endpoint, network.host, network.port)) {
      device.details.emplace_back(std::move(network));
    }
    break;
  }
  }

  device.properties["endpoint"] = endpoint;
  return true;
}

bool FixtureDeviceEnumerator::Enumerate(std::vector<DeviceInfo>& devices, std::string& error) {
  devices.clear();
  error.clear();

  std::ifstream input(fixture_path_, std::ios::binary);
  if (!input) {
    error = "unable to open device fixture file: " + fixture_path_.string();
    return false;
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const std::string trimmed = core::Trim(line);
    if (trimmed.empty() || trimmed.rfind("#", 0) == 0U) {
      continue;
    }

    const std::vector<std::string> fields = core::SplitTrimmed(trimmed, ',');
    if (fields.size() >= 2U && LooksLikeHeader(fields)) {
      continue;
    }

    DeviceInfo device;
    if (!ParseDeviceFixtureLine(trimmed, line_number, device, error)) {
      devices.clear();
      return false;
    }
    devices.push_back(std::move(device));
  }

  return true;
}

std::unique_ptr<IDeviceEnumerator> CreateDeviceEnumerator(const std::string& fixture_path) {
  if (!fixture_path.empty()) {
    return std::make_unique<FixtureDeviceEnumerator>(fixture_path);
  }
  const char* env_path = std::getenv(kDeviceFixtureEnvVar);
  if (env_path == nullptr || *env_path == '\0') {
    return nullptr;
  }
  return std::make_unique<FixtureDeviceEnumerator>(fs::path(env_path));
}

} // namespace hwbridge::devices
