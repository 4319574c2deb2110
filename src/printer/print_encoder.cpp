#include "printer/print_encoder.hpp"

#include "core/string_utils.hpp"

#include <algorithm>

namespace hwbridge::printer {

std::string ToString(PrintFormat format) {
  switch (format) {
  case PrintFormat::kRaw:
    return "raw";
  case PrintFormat::kEscPos:
    return "escpos";
  case PrintFormat::kZpl:
    return "zpl";
  case PrintFormat::kEpl:
    return "epl";
  }
  return "raw";
}

bool ParsePrintFormat(std::string_view raw, PrintFormat& format) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  if (normalized.empty() || normalized == "raw") {
    format = PrintFormat::kRaw;
  } else if (normalized == "escpos" || normalized == "esc/pos") {
    format = PrintFormat::kEscPos;
  } else if (normalized == "zpl") {
    format = PrintFormat::kZpl;
  } else if (normalized == "epl") {
    format = PrintFormat::kEpl;
  } else {
    return false;
  }
  return true;
}

bool PassthroughPrintEncoder::Encode(const devices::DeviceInfo& device, PrintFormat format,
                                     const core::Bytes& payload, core::Bytes& encoded,
                                     std::string& error) {
  const auto* detail = device.FindDetail<devices::PrinterDetail>();
  if (detail == nullptr) {
    error = "Device " + device.id + " is not a printer";
    return false;
  }
  if (payload.size() > detail->max_job_size) {
    error = "Print job of " + std::to_string(payload.size()) + " bytes exceeds the " +
            std::to_string(detail->max_job_size) + " byte limit";
    return false;
  }

  if (format != PrintFormat::kRaw) {
    const std::string wanted = format == PrintFormat::kEscPos ? "esc/pos" : ToString(format);
    const bool supported = std::any_of(
        detail->supported_protocols.begin(), detail->supported_protocols.end(),
        [&](const std::string& protocol) { return core::EqualsIgnoreCase(protocol, wanted); });
    if (!supported) {
      error = "Printer " + device.id + " does not support format " + ToString(format);
      return false;
    }
  }

  encoded = payload;
  return true;
}

std::unique_ptr<IPrintEncoder> CreateDefaultPrintEncoder() {
  return std::make_unique<PassthroughPrintEncoder>();
}

} // namespace hwbridge::printer
