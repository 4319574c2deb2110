#pragma once

#include "biometric/biometric_manager.hpp"
#include "config/gateway_config.hpp"
#include "core/logging/logger.hpp"
#include "devices/device_registry.hpp"
#include "devices/device_watcher.hpp"
#include "network/discovery_scanner.hpp"
#include "network/network_manager.hpp"
#include "printer/printer_service.hpp"
#include "queue/job_store.hpp"
#include "queue/queue_worker.hpp"
#include "rpc/notification_sink.hpp"
#include "services/device_job_executor.hpp"
#include "sessions/session_manager.hpp"
#include "system/host_metrics.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <string>

namespace hwbridge::services {

inline constexpr const char* kServerVersion = "1.0.0";

// Owns every subsystem behind the RPC surface and wires them together.
//
// Background timers (queue worker, device watcher) run on a private thread
// pool so they never compete with socket I/O. Notifications leave through the
// sink the transport installs; without one they are dropped.
class GatewayServices {
public:
  GatewayServices(config::GatewayConfig config, core::logging::Logger logger,
                  sessions::ChannelFactory channel_factory = sessions::CreateDefaultChannel);
  ~GatewayServices();

  GatewayServices(const GatewayServices&) = delete;
  GatewayServices& operator=(const GatewayServices&) = delete;

  // Opens the queue store, recovers interrupted jobs and starts the
  // background loops. A store that cannot be opened is a startup failure.
  bool Start(std::string& error);
  void Stop();

  void SetNotificationSink(rpc::INotificationSink* sink);

  // Adds a job, broadcasts it as pending and wakes the worker.
  bool EnqueueJob(const queue::NewJob& job, std::string& job_id, queue::StoreError& error);

  // Broadcasts `queue.updated` for one job.
  void PublishJobUpdate(const std::string& job_id, queue::JobStatus status);

  // Transport hook: a closed socket stops watching; sessions and jobs stay.
  void OnConnectionClosed(const std::string& connection_id);

  const config::GatewayConfig& Config() const {
    return config_;
  }
  devices::DeviceRegistry& Registry() {
    return registry_;
  }
  sessions::SessionManager& Sessions() {
    return sessions_;
  }
  network::NetworkManager& Network() {
    return network_;
  }
  network::DiscoveryScanner& Discovery() {
    return discovery_;
  }
  printer::PrinterService& Printers() {
    return printers_;
  }
  biometric::BiometricManager& Biometrics() {
    return biometrics_;
  }
  queue::JobStore& Store() {
    return store_;
  }
  queue::QueueWorker& Worker() {
    return worker_;
  }
  devices::DeviceWatcher& Watcher() {
    return watcher_;
  }
  system::HostMetricsSampler& Metrics() {
    return metrics_;
  }

  // Open WebSocket connections as reported by the installed sink.
  std::size_t ActiveConnections() const;

  // Seconds since this object was constructed.
  std::uint64_t UptimeSeconds() const;

private:
  void PublishDeviceEvent(const std::vector<std::string>& connection_ids,
                          const devices::DeviceEvent& event);

  config::GatewayConfig config_;
  core::logging::Logger logger_;
  std::chrono::steady_clock::time_point started_at_;
  std::atomic<rpc::INotificationSink*> sink_{nullptr};
  std::atomic<bool> running_{false};

  boost::asio::thread_pool background_;
  network::NetworkManager network_;
  devices::DeviceRegistry registry_;
  sessions::SessionManager sessions_;
  network::DiscoveryScanner discovery_;
  printer::PrinterService printers_;
  biometric::BiometricManager biometrics_;
  queue::JobStore store_;
  DeviceJobExecutor executor_;
  queue::QueueWorker worker_;
  devices::DeviceWatcher watcher_;
  system::HostMetricsSampler metrics_;
};

} // namespace hwbridge::services
