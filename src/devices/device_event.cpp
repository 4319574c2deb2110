#include "devices/device_event.hpp"

#include "core/time_utils.hpp"

#include <map>

namespace hwbridge::devices {

std::string ToString(DeviceEventType type) {
  switch (type) {
  case DeviceEventType::kDiscovered:
    return "discovered";
  case DeviceEventType::kRemoved:
    return "removed";
  case DeviceEventType::kStatusChanged:
    return "status_changed";
  case DeviceEventType::kConnected:
    return "connected";
  case DeviceEventType::kDisconnected:
    return "disconnected";
  }
  return "status_changed";
}

std::vector<DeviceEvent> DiffDeviceSets(const std::vector<DeviceInfo>& before,
                                        const std::vector<DeviceInfo>& after) {
  const auto now = std::chrono::system_clock::now();

  std::map<std::string, const DeviceInfo*> previous;
  for (const auto& device : before) {
    previous[device.id] = &device;
  }
  std::map<std::string, const DeviceInfo*> current;
  for (const auto& device : after) {
    current[device.id] = &device;
  }

  std::vector<DeviceEvent> events;
  for (const auto& [id, device] : previous) {
    (void)device;
    if (current.count(id) == 0U) {
      events.push_back({.type = DeviceEventType::kRemoved, .device_id = id, .ts = now});
    }
  }

  for (const auto& [id, device] : current) {
    const auto it = previous.find(id);
    if (it == previous.end()) {
      events.push_back(
          {.type = DeviceEventType::kDiscovered, .device_id = id, .device = *device, .ts = now});
      continue;
    }

    const DeviceInfo& old_device = *it->second;
    if (old_device.is_connected != device->is_connected) {
      events.push_back({.type = device->is_connected ? DeviceEventType::kConnected
                                                     : DeviceEventType::kDisconnected,
                        .device_id = id,
                        .device = *device,
                        .ts = now});
    } else if (old_device.status != device->status) {
      events.push_back({.type = DeviceEventType::kStatusChanged,
                        .device_id = id,
                        .device = *device,
                        .ts = now});
    }
  }
  return events;
}

core::json::Value ToJson(const DeviceEvent& event) {
  core::json::Value out = core::json::MakeObject();
  out.Set("eventType", core::json::MakeString(ToString(event.type)));
  out.Set("deviceId", core::json::MakeString(event.device_id));
  if (event.device.has_value()) {
    out.Set("device", ToJson(*event.device));
  }
  out.Set("timestamp", core::json::MakeString(core::FormatUtcTimestamp(event.ts)));
  return out;
}

} // namespace hwbridge::devices
