#pragma once

#include "devices/device_info.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::devices {

// OS-level device discovery collaborator.
//
// Implementations report live devices only; the registry owns caching,
// session-state merging and the simulated fallback.
class IDeviceEnumerator {
public:
  virtual ~IDeviceEnumerator() = default;

  // Returns false when the underlying source is unavailable or failed. The
  // registry treats both the same way and degrades to simulated devices.
  virtual bool Enumerate(std::vector<DeviceInfo>& devices, std::string& error) = 0;

  // Short label used in logs (e.g. "fixture").
  virtual std::string_view Name() const = 0;
};

// Environment variable naming a device fixture when config leaves
// `deviceFixturePath` empty.
inline constexpr const char* kDeviceFixtureEnvVar = "HWBRIDGE_DEVICE_FIXTURE";

// Builds the enumerator for this host. Returns nullptr when no enumeration
// source is configured at all.
std::unique_ptr<IDeviceEnumerator> CreateDeviceEnumerator(const std::string& fixture_path);

} // namespace hwbridge::devices
