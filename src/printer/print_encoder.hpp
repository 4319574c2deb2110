#pragma once

#include "core/payload_encoding.hpp"
#include "devices/device_info.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace hwbridge::printer {

enum class PrintFormat {
  kRaw,
  kEscPos,
  kZpl,
  kEpl,
};

std::string ToString(PrintFormat format);
// Accepts raw, escpos / esc/pos, zpl, epl (case-insensitive).
bool ParsePrintFormat(std::string_view raw, PrintFormat& format);

// Turns a client payload into the printer's command-language bytes. The
// command-language generators themselves live outside the gateway; this seam
// is where they plug in.
class IPrintEncoder {
public:
  virtual ~IPrintEncoder() = default;
  virtual bool Encode(const devices::DeviceInfo& device, PrintFormat format,
                      const core::Bytes& payload, core::Bytes& encoded, std::string& error) = 0;
};

// Forwards payloads unchanged once the printer is known to speak the format.
// Clients are expected to send ready-made ESC/POS, ZPL or EPL.
class PassthroughPrintEncoder final : public IPrintEncoder {
public:
  bool Encode(const devices::DeviceInfo& device, PrintFormat format, const core::Bytes& payload,
              core::Bytes& encoded, std::string& error) override;
};

std::unique_ptr<IPrintEncoder> CreateDefaultPrintEncoder();

} // namespace hwbridge::printer
