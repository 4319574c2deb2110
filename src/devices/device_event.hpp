#pragma once

#include "core/json_dom.hpp"
#include "devices/device_info.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hwbridge::devices {

// Device change categories pushed to watching connections.
enum class DeviceEventType {
  kDiscovered,
  kRemoved,
  kStatusChanged,
  kConnected,
  kDisconnected,
};

struct DeviceEvent {
  DeviceEventType type = DeviceEventType::kStatusChanged;
  std::string device_id;
  // Latest record; absent for kRemoved.
  std::optional<DeviceInfo> device;
  std::chrono::system_clock::time_point ts{};
};

std::string ToString(DeviceEventType type);

// Compares two catalog snapshots keyed by device id. Output order is stable:
// removals first, then additions and changes in id order. A device whose
// connection flag flipped yields kConnected/kDisconnected; any other status
// difference yields kStatusChanged.
std::vector<DeviceEvent> DiffDeviceSets(const std::vector<DeviceInfo>& before,
                                        const std::vector<DeviceInfo>& after);

// Notification params: {eventType, deviceId, device?, timestamp}.
core::json::Value ToJson(const DeviceEvent& event);

} // namespace hwbridge::devices
