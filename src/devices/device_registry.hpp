#pragma once

#include "core/logging/logger.hpp"
#include "devices/device_enumerator.hpp"
#include "devices/device_event.hpp"
#include "devices/device_info.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hwbridge::devices {

// Live session state the registry overlays onto enumerated devices.
struct SessionState {
  DeviceStatus status = DeviceStatus::kConnected;
  std::string connection_id;
};

// Implemented by the session manager. Lookups must be safe from any thread.
class ISessionStateSource {
public:
  virtual ~ISessionStateSource() = default;
  virtual std::optional<SessionState> LookupSession(const std::string& device_id) const = 0;
};

inline constexpr const char* kSourceReal = "real";
inline constexpr const char* kSourceSimulated = "simulated";

struct EnumerationResult {
  std::vector<DeviceInfo> devices;
  // kSourceReal or kSourceSimulated.
  std::string source;
  std::chrono::system_clock::time_point timestamp{};
};

// Canonical device catalog.
//
// Enumeration goes to the OS enumerator when one is configured and degrades to
// the simulated set when it is missing or fails; the degradation is visible as
// `source == "simulated"`. Results are cached until a forced refresh or a
// watch-loop refresh. Every read overlays current session state.
class DeviceRegistry {
public:
  DeviceRegistry(std::unique_ptr<IDeviceEnumerator> enumerator, core::logging::Logger logger);

  // The session manager registers itself after construction; may be null.
  void SetSessionStateSource(const ISessionStateSource* source);

  EnumerationResult Enumerate(bool force_refresh);

  // Looks up one device, enumerating first when the cache is empty.
  bool Get(const std::string& device_id, DeviceInfo& device, std::string& error);

  // Re-enumerates and returns the changes since the previous refresh.
  std::vector<DeviceEvent> Refresh();

  void Watch(const std::string& connection_id);
  void Unwatch(const std::string& connection_id);
  bool IsWatching(const std::string& connection_id) const;
  std::vector<std::string> WatchingConnections() const;

private:
  // Caller holds mutex_.
  void EnumerateLocked();
  std::vector<DeviceInfo> MergeSessionState(const std::vector<DeviceInfo>& devices) const;

  std::unique_ptr<IDeviceEnumerator> enumerator_;
  core::logging::Logger logger_;
  const ISessionStateSource* session_source_ = nullptr;

  mutable std::mutex mutex_;
  bool cache_valid_ = false;
  std::vector<DeviceInfo> cache_;
  std::string cache_source_ = kSourceSimulated;
  std::chrono::system_clock::time_point cache_timestamp_{};
  std::vector<DeviceInfo> last_published_;
  bool has_published_ = false;
  std::set<std::string> watchers_;
};

} // namespace hwbridge::devices
