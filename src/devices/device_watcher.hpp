#pragma once

#include "core/logging/logger.hpp"
#include "devices/device_event.hpp"
#include "devices/device_registry.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hwbridge::devices {

// Receives one event together with the connections watching at that moment.
using DeviceEventSink =
    std::function<void(const std::vector<std::string>& connection_ids, const DeviceEvent& event)>;

// Periodic refresh loop behind devices.watch. Enumeration only runs while at
// least one connection is watching; the first pass after idle re-baselines
// without emitting events.
class DeviceWatcher {
public:
  DeviceWatcher(boost::asio::any_io_executor executor, DeviceRegistry& registry,
                std::chrono::milliseconds interval, DeviceEventSink sink,
                core::logging::Logger logger);

  void Start();
  void Stop();

  // One refresh pass; exposed so tests can drive the loop without a timer.
  std::size_t PollOnce();

private:
  void ScheduleNext();

  std::mutex timer_mutex_;
  boost::asio::steady_timer timer_;
  DeviceRegistry& registry_;
  std::chrono::milliseconds interval_;
  DeviceEventSink sink_;
  core::logging::Logger logger_;
  std::atomic<bool> running_{false};
  std::atomic<bool> had_watchers_{false};
};

} // namespace hwbridge::devices
