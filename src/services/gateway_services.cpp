#include "services/gateway_services.hpp"

#include "core/time_utils.hpp"
#include "devices/device_enumerator.hpp"
#include "rpc/jsonrpc_message.hpp"

#include <boost/asio/post.hpp>

namespace hwbridge::services {

namespace {

constexpr std::size_t kBackgroundThreads = 2;

} // namespace

GatewayServices::GatewayServices(config::GatewayConfig config, core::logging::Logger logger,
                                 sessions::ChannelFactory channel_factory)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      started_at_(std::chrono::steady_clock::now()),
      background_(kBackgroundThreads),
      network_(config_.network, logger_.Child("network")),
      registry_(devices::CreateDeviceEnumerator(config_.device_fixture_path),
                logger_.Child("registry")),
      sessions_(registry_, network_, logger_.Child("sessions"), std::move(channel_factory)),
      discovery_(logger_.Child("discovery")),
      printers_(registry_, network_, printer::CreateDefaultPrintEncoder(),
                logger_.Child("printer")),
      biometrics_(logger_.Child("biometric")),
      store_(config_.database_path, logger_.Child("queue")),
      executor_(printers_, sessions_, logger_.Child("executor")),
      worker_(background_.get_executor(), store_, executor_,
              queue::RetryPolicy{
                  .max_retry_attempts = config_.queue.max_retry_attempts,
                  .retry_interval = config_.queue.retry_interval,
              },
              config_.queue.poll_interval,
              [this](const std::string& job_id, queue::JobStatus status) {
                PublishJobUpdate(job_id, status);
              },
              logger_.Child("worker")),
      watcher_(background_.get_executor(), registry_, config_.watch_interval,
               [this](const std::vector<std::string>& connection_ids,
                      const devices::DeviceEvent& event) {
                 PublishDeviceEvent(connection_ids, event);
               },
               logger_.Child("watcher")) {}

GatewayServices::~GatewayServices() {
  Stop();
  background_.join();
}

bool GatewayServices::Start(std::string& error) {
  if (running_) {
    return true;
  }
  if (!store_.Open(error)) {
    logger_.Error("queue store unavailable",
                  {{"path", config_.database_path}, {"error", error}});
    return false;
  }

  std::size_t recovered = 0;
  queue::StoreError store_error;
  if (!store_.RecoverStaleJobs(config_.queue.max_retry_attempts, recovered, store_error)) {
    error = "failed to recover interrupted jobs: " + store_error.message;
    logger_.Error("queue recovery failed", {{"error", store_error.message}});
    store_.Close();
    return false;
  }
  if (recovered > 0) {
    logger_.Warn("recovered interrupted jobs", {{"count", std::to_string(recovered)}});
  }

  running_ = true;
  worker_.Start();
  watcher_.Start();
  logger_.Info("services started", {{"database_path", config_.database_path},
                                    {"watch_interval_ms",
                                     std::to_string(config_.watch_interval.count())}});
  return true;
}

void GatewayServices::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  watcher_.Stop();
  worker_.Stop();
  sessions_.CloseAll();
  network_.CloseAll();
  store_.Close();
  logger_.Info("services stopped");
}

void GatewayServices::SetNotificationSink(rpc::INotificationSink* sink) {
  sink_ = sink;
}

bool GatewayServices::EnqueueJob(const queue::NewJob& job, std::string& job_id,
                                 queue::StoreError& error) {
  if (!store_.AddJob(job, config_.queue.max_queue_size, job_id, error)) {
    return false;
  }
  PublishJobUpdate(job_id, queue::JobStatus::kPending);
  if (running_) {
    boost::asio::post(background_, [this]() {
      if (running_) {
        worker_.Drain();
      }
    });
  }
  return true;
}

void GatewayServices::PublishJobUpdate(const std::string& job_id, queue::JobStatus status) {
  rpc::INotificationSink* sink = sink_.load();
  if (sink == nullptr) {
    return;
  }
  core::json::Value params = core::json::MakeObject();
  params.Set("jobId", core::json::MakeString(job_id));
  params.Set("status", core::json::MakeString(queue::ToString(status)));
  params.Set("timestamp", core::json::MakeString(core::NowUtcTimestamp()));
  sink->Broadcast(rpc::BuildNotification("queue.updated", std::move(params)));
}

void GatewayServices::PublishDeviceEvent(const std::vector<std::string>& connection_ids,
                                         const devices::DeviceEvent& event) {
  rpc::INotificationSink* sink = sink_.load();
  if (sink == nullptr) {
    return;
  }
  const std::string frame = rpc::BuildNotification("devices.event", devices::ToJson(event));
  for (const auto& connection_id : connection_ids) {
    if (!sink->SendTo(connection_id, frame)) {
      // Closed between the snapshot and delivery.
      registry_.Unwatch(connection_id);
    }
  }
}

void GatewayServices::OnConnectionClosed(const std::string& connection_id) {
  registry_.Unwatch(connection_id);
}

std::size_t GatewayServices::ActiveConnections() const {
  const rpc::INotificationSink* sink = sink_.load();
  return sink == nullptr ? 0 : sink->ConnectionCount();
}

std::uint64_t GatewayServices::UptimeSeconds() const {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() -
                                                       started_at_)
          .count());
}

} // namespace hwbridge::services
