#include "devices/device_registry.hpp"

#include "devices/simulated_devices.hpp"

#include <algorithm>

namespace hwbridge::devices {

DeviceRegistry::DeviceRegistry(std::unique_ptr<IDeviceEnumerator> enumerator,
                               core::logging::Logger logger)
    : enumerator_(std::move(enumerator)), logger_(std::move(logger)) {}

void DeviceRegistry::SetSessionStateSource(const ISessionStateSource* source) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_source_ = source;
}

void DeviceRegistry::EnumerateLocked() {
  std::vector<DeviceInfo> devices;
  std::string error;

  if (enumerator_ == nullptr) {
    cache_ = BuildSimulatedDevices();
    cache_source_ = kSourceSimulated;
    logger_.Debug("no device enumerator configured; serving simulated devices");
  } else if (!enumerator_->Enumerate(devices, error)) {
    cache_ = BuildSimulatedDevices();
    cache_source_ = kSourceSimulated;
    logger_.Warn("device enumeration failed; serving simulated devices",
                 {{"enumerator", enumerator_->Name()}, {"error", error}});
  } else {
    cache_ = std::move(devices);
    cache_source_ = kSourceReal;
    logger_.Debug("device enumeration complete",
                  {{"enumerator", enumerator_->Name()},
                   {"count", std::to_string(cache_.size())}});
  }

  std::sort(cache_.begin(), cache_.end(),
            [](const DeviceInfo& lhs, const DeviceInfo& rhs) { return lhs.id < rhs.id; });
  cache_timestamp_ = std::chrono::system_clock::now();
  cache_valid_ = true;
}

std::vector<DeviceInfo> DeviceRegistry::MergeSessionState(
    const std::vector<DeviceInfo>& devices) const {
  std::vector<DeviceInfo> merged = devices;
  if (session_source_ == nullptr) {
    return merged;
  }
  for (auto& device : merged) {
    const std::optional<SessionState> state = session_source_->LookupSession(device.id);
    if (!state.has_value()) {
      device.status = DeviceStatus::kAvailable;
      device.is_connected = false;
      device.connection_id.reset();
      continue;
    }
    device.status = state->status;
    device.is_connected = state->status == DeviceStatus::kConnected;
    device.connection_id = state->connection_id;
  }
  return merged;
}

EnumerationResult DeviceRegistry::Enumerate(bool force_refresh) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (force_refresh || !cache_valid_) {
    EnumerateLocked();
  }
  return EnumerationResult{
      .devices = MergeSessionState(cache_),
      .source = cache_source_,
      .timestamp = cache_timestamp_,
  };
}

bool DeviceRegistry::Get(const std::string& device_id, DeviceInfo& device, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!cache_valid_) {
    EnumerateLocked();
  }
  const auto it = std::find_if(cache_.begin(), cache_.end(),
                               [&](const DeviceInfo& entry) { return entry.id == device_id; });
  if (it == cache_.end()) {
    error = "Device not found: " + device_id;
    return false;
  }
  std::vector<DeviceInfo> merged = MergeSessionState({*it});
  device = std::move(merged.front());
  return true;
}

std::vector<DeviceEvent> DeviceRegistry::Refresh() {
  std::lock_guard<std::mutex> lock(mutex_);
  EnumerateLocked();
  std::vector<DeviceInfo> merged = MergeSessionState(cache_);
  std::vector<DeviceEvent> events;
  if (has_published_) {
    events = DiffDeviceSets(last_published_, merged);
  }
  last_published_ = std::move(merged);
  has_published_ = true;
  return events;
}

void DeviceRegistry::Watch(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  watchers_.insert(connection_id);
}

void DeviceRegistry::Unwatch(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  watchers_.erase(connection_id);
}

bool DeviceRegistry::IsWatching(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watchers_.count(connection_id) != 0U;
}

std::vector<std::string> DeviceRegistry::WatchingConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(watchers_.begin(), watchers_.end());
}

} // namespace hwbridge::devices
