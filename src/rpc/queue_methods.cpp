#include "core/time_utils.hpp"
#include "rpc/gateway_methods.hpp"
#include "rpc/method_support.hpp"

namespace hwbridge::rpc {

namespace {

using core::errors::RpcError;
using core::errors::RpcErrorCode;
using core::json::Value;

constexpr double kHealthWarningPercent = 90.0;

bool FailWithStore(RpcError& error, const queue::StoreError& store_error) {
  switch (store_error.kind) {
  case queue::StoreErrorKind::kNotFound:
    return FailWith(error, RpcErrorCode::kJobNotFound, store_error.message);
  case queue::StoreErrorKind::kQueueFull:
    return FailWith(error, RpcErrorCode::kQueueFull, store_error.message);
  case queue::StoreErrorKind::kInvalidTransition:
    return FailWith(error, RpcErrorCode::kValidationFailed, store_error.message);
  case queue::StoreErrorKind::kStorage:
    break;
  }
  return FailWith(error, RpcErrorCode::kInternalError, store_error.message);
}

} // namespace

void RegisterQueueMethods(Dispatcher& dispatcher, services::GatewayServices& services) {
  dispatcher.Register("queue.getStatus", [&services](const RequestContext&, const Value&,
                                                     Value& result, RpcError& error) {
    queue::QueueStatus status;
    queue::StoreError store_error;
    if (!services.Store().GetQueueStatus(status, store_error)) {
      return FailWithStore(error, store_error);
    }
    result = queue::ToJson(status);
    return true;
  });

  dispatcher.Register(
      "queue.getJobs",
      Typed<QueueJobsRequest>([&services](const RequestContext&, const QueueJobsRequest& request,
                                          Value& result, RpcError& error) {
        std::vector<queue::QueueJob> jobs;
        queue::StoreError store_error;
        if (!services.Store().GetJobs(request.filter, jobs, store_error)) {
          return FailWithStore(error, store_error);
        }
        Value list = core::json::MakeArray();
        for (const auto& job : jobs) {
          list.Push(queue::ToJson(job));
        }
        result = core::json::MakeObject();
        result.Set("jobs", std::move(list));
        SetCount(result, "count", jobs.size());
        return true;
      }));

  dispatcher.Register(
      "queue.cancelJob",
      Typed<QueueCancelRequest>([&services](const RequestContext&,
                                            const QueueCancelRequest& request, Value& result,
                                            RpcError& error) {
        bool cancelled = false;
        queue::StoreError store_error;
        if (!services.Store().CancelJob(request.job_id, cancelled, store_error)) {
          return FailWithStore(error, store_error);
        }
        if (cancelled) {
          services.PublishJobUpdate(request.job_id, queue::JobStatus::kCancelled);
        }
        result = core::json::MakeObject();
        SetField(result, "success", true);
        SetField(result, "jobId", request.job_id);
        SetField(result, "cancelled", cancelled);
        return true;
      }));
}

void RegisterSystemMethods(Dispatcher& dispatcher, services::GatewayServices& services) {
  dispatcher.Register("system.getInfo", [&services](const RequestContext&, const Value&,
                                                    Value& result, RpcError&) {
    const system::HostMetrics metrics = services.Metrics().Sample();
    result = core::json::MakeObject();
    SetField(result, "version", services::kServerVersion);
    SetField(result, "platform", metrics.platform);
    SetField(result, "osVersion", metrics.os_version);
    SetField(result, "architecture", metrics.architecture);
    SetField(result, "hostname", metrics.hostname);
    SetCount(result, "cpuCores", metrics.cpu_logical_cores);
    SetCount(result, "totalMemory", metrics.ram_total_bytes);
    SetField(result, "timestamp", core::NowUtcTimestamp());
    SetCount(result, "uptime", services.UptimeSeconds());
    return true;
  });

  dispatcher.Register("system.getHealth", [&services](const RequestContext&, const Value&,
                                                      Value& result, RpcError& error) {
    const system::HostMetrics metrics = services.Metrics().Sample();
    const devices::EnumerationResult enumeration = services.Registry().Enumerate(false);
    std::size_t connected = 0;
    for (const auto& device : enumeration.devices) {
      if (device.is_connected) {
        ++connected;
      }
    }
    queue::QueueStatus queue_status;
    queue::StoreError store_error;
    if (!services.Store().GetQueueStatus(queue_status, store_error)) {
      return FailWithStore(error, store_error);
    }

    std::string status = "healthy";
    if (enumeration.devices.empty()) {
      status = "no_devices";
    } else if (metrics.cpu_usage_percent >= kHealthWarningPercent ||
               metrics.memory_usage_percent >= kHealthWarningPercent) {
      status = "warning";
    }

    result = core::json::MakeObject();
    SetField(result, "status", status);
    SetField(result, "timestamp", core::NowUtcTimestamp());
    SetCount(result, "totalDevices", enumeration.devices.size());
    SetCount(result, "connectedDevices", connected);
    SetCount(result, "activeConnections", services.ActiveConnections());
    SetCount(result, "jobsInQueue", queue_status.pending + queue_status.processing);
    SetField(result, "cpuUsage", metrics.cpu_usage_percent);
    SetField(result, "memoryUsage", metrics.memory_usage_percent);
    SetField(result, "deviceSource", enumeration.source);
    return true;
  });
}

void RegisterGatewayMethods(Dispatcher& dispatcher, services::GatewayServices& services) {
  RegisterDeviceMethods(dispatcher, services);
  RegisterPrinterMethods(dispatcher, services);
  RegisterBiometricMethods(dispatcher, services);
  RegisterSessionMethods(dispatcher, services);
  RegisterNetworkMethods(dispatcher, services);
  RegisterQueueMethods(dispatcher, services);
  RegisterSystemMethods(dispatcher, services);
}

} // namespace hwbridge::rpc
