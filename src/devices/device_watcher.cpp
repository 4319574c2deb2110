#include "devices/device_watcher.hpp"

#include <boost/asio/error.hpp>

namespace hwbridge::devices {

DeviceWatcher::DeviceWatcher(boost::asio::any_io_executor executor, DeviceRegistry& registry,
                             std::chrono::milliseconds interval, DeviceEventSink sink,
                             core::logging::Logger logger)
    : timer_(std::move(executor)),
      registry_(registry),
      interval_(interval),
      sink_(std::move(sink)),
      logger_(std::move(logger)) {}

void DeviceWatcher::Start() {
  if (running_.exchange(true)) {
    return;
  }
  ScheduleNext();
}

void DeviceWatcher::Stop() {
  running_ = false;
  std::lock_guard<std::mutex> lock(timer_mutex_);
  timer_.cancel();
}

std::size_t DeviceWatcher::PollOnce() {
  const std::vector<std::string> watchers = registry_.WatchingConnections();
  if (watchers.empty()) {
    had_watchers_ = false;
    return 0;
  }

  std::vector<DeviceEvent> events = registry_.Refresh();
  if (!had_watchers_) {
    had_watchers_ = true;
    return 0;
  }

  for (const auto& event : events) {
    logger_.Debug("device event", {{"event", ToString(event.type)}, {"device_id", event.device_id}});
    sink_(watchers, event);
  }
  return events.size();
}

void DeviceWatcher::ScheduleNext() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (!running_) {
    return;
  }
  timer_.expires_after(interval_);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || !running_) {
      return;
    }
    PollOnce();
    ScheduleNext();
  });
}

} // namespace hwbridge::devices
