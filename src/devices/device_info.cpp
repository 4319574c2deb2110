#include "devices/device_info.hpp"

#include "core/string_utils.hpp"
#include "core/time_utils.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace hwbridge::devices {

namespace {

using core::json::MakeBool;
using core::json::MakeNumber;
using core::json::MakeString;
using JsonValue = core::json::Value;

std::string FormatHex16(std::uint16_t value) {
  std::ostringstream out;
  out << std::hex << std::setw(4) << std::setfill('0') << value;
  return out.str();
}

} // namespace

std::string ToString(DeviceType type) {
  switch (type) {
  case DeviceType::kPrinter:
    return "printer";
  case DeviceType::kSerial:
    return "serial";
  case DeviceType::kUsbHid:
    return "usbhid";
  case DeviceType::kNetwork:
    return "network";
  case DeviceType::kBiometric:
    return "biometric";
  }
  return "serial";
}

std::string ToString(DeviceStatus status) {
  switch (status) {
  case DeviceStatus::kAvailable:
    return "available";
  case DeviceStatus::kConnected:
    return "connected";
  case DeviceStatus::kError:
    return "error";
  }
  return "available";
}

bool ParseDeviceType(std::string_view raw, DeviceType& type) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  if (normalized == "printer") {
    type = DeviceType::kPrinter;
  } else if (normalized == "serial") {
    type = DeviceType::kSerial;
  } else if (normalized == "usbhid" || normalized == "usb" || normalized == "hid") {
    type = DeviceType::kUsbHid;
  } else if (normalized == "network") {
    type = DeviceType::kNetwork;
  } else if (normalized == "biometric") {
    type = DeviceType::kBiometric;
  } else {
    return false;
  }
  return true;
}

JsonValue ToJson(const PrinterDetail& detail) {
  JsonValue out = core::json::MakeObject();
  out.Set("supportedProtocols", core::json::MakeStringArray(detail.supported_protocols));
  out.Set("maxPrintWidth", MakeNumber(detail.max_print_width));
  out.Set("supportsColor", MakeBool(detail.supports_color));
  out.Set("supportsDuplex", MakeBool(detail.supports_duplex));
  out.Set("maxResolution", MakeNumber(detail.max_resolution));
  out.Set("maxJobSize", MakeNumber(static_cast<double>(detail.max_job_size)));
  if (!detail.device_path.empty()) {
    out.Set("devicePath", MakeString(detail.device_path));
  }
  return out;
}

JsonValue ToJson(const SerialDetail& detail) {
  JsonValue rates = core::json::MakeArray();
  for (const auto rate : detail.supported_baud_rates) {
    rates.Push(MakeNumber(rate));
  }
  JsonValue out = core::json::MakeObject();
  out.Set("portName", MakeString(detail.port_name));
  out.Set("supportedBaudRates", std::move(rates));
  out.Set("defaultBaudRate", MakeNumber(detail.default_baud_rate));
  if (!detail.device_path.empty()) {
    out.Set("devicePath", MakeString(detail.device_path));
  }
  return out;
}

JsonValue ToJson(const UsbHidDetail& detail) {
  JsonValue out = core::json::MakeObject();
  out.Set("vendorId", MakeString(FormatHex16(detail.vendor_id)));
  out.Set("productId", MakeString(FormatHex16(detail.product_id)));
  out.Set("devicePath", MakeString(detail.device_path));
  out.Set("inputReportLength", MakeNumber(detail.input_report_length));
  out.Set("outputReportLength", MakeNumber(detail.output_report_length));
  out.Set("featureReportLength", MakeNumber(detail.feature_report_length));
  return out;
}

JsonValue ToJson(const NetworkDetail& detail) {
  JsonValue out = core::json::MakeObject();
  out.Set("host", MakeString(detail.host));
  out.Set("port", MakeNumber(detail.port));
  out.Set("protocol", MakeString(detail.protocol));
  return out;
}

JsonValue ToJson(const BiometricDetail& detail) {
  JsonValue out = core::json::MakeObject();
  out.Set("maxUsers", MakeNumber(detail.max_users));
  out.Set("supportedModes", core::json::MakeStringArray(detail.supported_modes));
  return out;
}

JsonValue ToJson(const DeviceInfo& device) {
  JsonValue properties = core::json::MakeObject();
  for (const auto& [key, value] : device.properties) {
    properties.Set(key, MakeString(value));
  }

  JsonValue out = core::json::MakeObject();
  out.Set("id", MakeString(device.id));
  out.Set("name", MakeString(device.name));
  out.Set("type", MakeString(ToString(device.type)));
  out.Set("status", MakeString(ToString(device.status)));
  out.Set("manufacturer", MakeString(device.manufacturer));
  out.Set("model", MakeString(device.model));
  out.Set("serialNumber", MakeString(device.serial_number));
  out.Set("properties", std::move(properties));
  out.Set("lastSeen", MakeString(core::FormatUtcTimestamp(device.last_seen)));
  out.Set("isConnected", MakeBool(device.is_connected));
  if (device.connection_id.has_value()) {
    out.Set("connectionId", MakeString(*device.connection_id));
  }
  out.Set("simulated", MakeBool(device.simulated));

  for (const auto& detail : device.details) {
    std::visit(
        [&out](const auto& typed) {
          using Detail = std::decay_t<decltype(typed)>;
          if constexpr (std::is_same_v<Detail, PrinterDetail>) {
            out.Set("printer", ToJson(typed));
          } else if constexpr (std::is_same_v<Detail, SerialDetail>) {
            out.Set("serial", ToJson(typed));
          } else if constexpr (std::is_same_v<Detail, UsbHidDetail>) {
            out.Set("usbhid", ToJson(typed));
          } else if constexpr (std::is_same_v<Detail, NetworkDetail>) {
            out.Set("network", ToJson(typed));
          } else {
            out.Set("biometric", ToJson(typed));
          }
        },
        detail);
  }
  return out;
}

} // namespace hwbridge::devices
