#pragma once

#include "devices/device_info.hpp"

#include <vector>

namespace hwbridge::devices {

// Fixed device set served when no OS enumerator is available. Every device is
// marked `simulated` and backed by in-memory channels, so a fresh install can
// exercise each RPC namespace without hardware.
std::vector<DeviceInfo> BuildSimulatedDevices();

} // namespace hwbridge::devices
