#pragma once

#include "devices/device_enumerator.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hwbridge::devices {

// Enumerates devices from a CSV descriptor file standing in for the platform
// enumeration tools. One device per line:
//
//   type,id,name,manufacturer,model,serialNumber,endpoint
//
// `endpoint` depends on type:
// - serial:    device node, e.g. /dev/ttyUSB0
// - usbhid:    vid:pid@node, e.g. 1234:5678@/dev/hidraw0 (hex ids)
// - network:   host:port
// - printer:   device node (/dev/usb/lp0) or host:port for network printers
// - biometric: optional host:port
//
// Blank lines, `#` comments and a leading header row are skipped.
class FixtureDeviceEnumerator final : public IDeviceEnumerator {
public:
  explicit FixtureDeviceEnumerator(std::filesystem::path fixture_path);

  bool Enumerate(std::vector<DeviceInfo>& devices, std::string& error) override;

  std::string_view Name() const override {
    return "fixture";
  }

private:
  std::filesystem::path fixture_path_;
};

// Parses one descriptor row. Exposed for unit tests.
bool ParseDeviceFixtureLine(const std::string& line, std::size_t line_number, DeviceInfo& device,
                            std::string& error);

} // namespace hwbridge::devices
