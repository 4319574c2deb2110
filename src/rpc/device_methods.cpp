#include "core/time_utils.hpp"
#include "queue/job_model.hpp"
#include "rpc/gateway_methods.hpp"
#include "rpc/method_support.hpp"
#include "services/device_job_executor.hpp"

namespace hwbridge::rpc {

namespace {

using core::errors::RpcError;
using core::errors::RpcErrorCode;
using core::json::Value;

RpcErrorCode ToRpcCode(printer::PrintErrorKind kind) {
  switch (kind) {
  case printer::PrintErrorKind::kNotFound:
    return RpcErrorCode::kDeviceNotFound;
  case printer::PrintErrorKind::kNotPrinter:
    return RpcErrorCode::kUnsupportedOperation;
  case printer::PrintErrorKind::kValidation:
    return RpcErrorCode::kValidationFailed;
  case printer::PrintErrorKind::kIo:
    return RpcErrorCode::kDeviceIoError;
  }
  return RpcErrorCode::kDeviceIoError;
}

// Biometric calls are only valid against devices advertising the capability.
bool ResolveBiometric(services::GatewayServices& services, const std::string& device_id,
                      devices::BiometricDetail& detail, RpcError& error) {
  devices::DeviceInfo device;
  std::string lookup_error;
  if (!services.Registry().Get(device_id, device, lookup_error)) {
    return FailWith(error, RpcErrorCode::kDeviceNotFound, lookup_error);
  }
  const auto* found = device.FindDetail<devices::BiometricDetail>();
  if (found == nullptr) {
    return FailWith(error, RpcErrorCode::kUnsupportedOperation,
                    "Device " + device_id + " is not a biometric reader");
  }
  detail = *found;
  return true;
}

std::size_t CountPendingJobs(services::GatewayServices& services, const std::string& device_id) {
  queue::JobFilter filter;
  filter.device_id = device_id;
  filter.status = queue::JobStatus::kPending;
  filter.limit = services.Config().queue.max_queue_size;
  std::vector<queue::QueueJob> jobs;
  queue::StoreError store_error;
  if (!services.Store().GetJobs(filter, jobs, store_error)) {
    return 0;
  }
  return jobs.size();
}

} // namespace

void RegisterDeviceMethods(Dispatcher& dispatcher, services::GatewayServices& services) {
  dispatcher.Register(
      "devices.enumerate",
      Typed<EnumerateRequest>([&services](const RequestContext&, const EnumerateRequest& request,
                                          Value& result, RpcError&) {
        const devices::EnumerationResult enumeration =
            services.Registry().Enumerate(request.force_refresh);
        Value list = core::json::MakeArray();
        for (const auto& device : enumeration.devices) {
          list.Push(devices::ToJson(device));
        }
        result = core::json::MakeObject();
        result.Set("devices", std::move(list));
        SetField(result, "source", enumeration.source);
        SetCount(result, "count", enumeration.devices.size());
        SetField(result, "timestamp", core::FormatUtcTimestamp(enumeration.timestamp));
        return true;
      }));

  dispatcher.Register(
      "devices.get",
      Typed<DeviceRequest>([&services](const RequestContext&, const DeviceRequest& request,
                                       Value& result, RpcError& error) {
        devices::DeviceInfo device;
        std::string lookup_error;
        if (!services.Registry().Get(request.device_id, device, lookup_error)) {
          return FailWith(error, RpcErrorCode::kDeviceNotFound, lookup_error);
        }
        result = devices::ToJson(device);
        return true;
      }));

  dispatcher.Register("devices.watch", [&services](const RequestContext& context, const Value&,
                                                   Value& result, RpcError&) {
    services.Registry().Watch(context.connection_id);
    result = core::json::MakeObject();
    SetField(result, "success", true);
    SetField(result, "watching", true);
    return true;
  });

  dispatcher.Register("devices.unwatch", [&services](const RequestContext& context, const Value&,
                                                     Value& result, RpcError&) {
    services.Registry().Unwatch(context.connection_id);
    result = core::json::MakeObject();
    SetField(result, "success", true);
    SetField(result, "watching", false);
    return true;
  });
}

void RegisterPrinterMethods(Dispatcher& dispatcher, services::GatewayServices& services) {
  dispatcher.Register(
      "printer.print",
      Typed<PrintRequest>([&services](const RequestContext&, const PrintRequest& request,
                                      Value& result, RpcError& error) {
        devices::DeviceInfo device;
        printer::PrintError print_error;
        if (!services.Printers().ResolvePrinter(request.device_id, device, print_error)) {
          return FailWith(error, ToRpcCode(print_error.kind), print_error.message);
        }

        // Decode now so a bad payload is rejected before it reaches the queue.
        core::Bytes payload;
        std::string decode_error;
        if (!core::DecodePayload(request.data, request.encoding, payload, decode_error)) {
          return FailWith(error, RpcErrorCode::kValidationFailed, decode_error);
        }
        const auto* capabilities = device.FindDetail<devices::PrinterDetail>();
        if (capabilities != nullptr && payload.size() > capabilities->max_job_size) {
          return FailWith(error, RpcErrorCode::kValidationFailed,
                          "Print job of " + std::to_string(payload.size()) +
                              " bytes exceeds the printer limit of " +
                              std::to_string(capabilities->max_job_size));
        }

        queue::NewJob job{
            .device_id = request.device_id,
            .device_type = devices::ToString(devices::DeviceType::kPrinter),
            .operation = services::kOperationPrint,
        };
        SetField(job.parameters, "data", request.data);
        SetField(job.parameters, "format", printer::ToString(request.format));
        SetField(job.parameters, "encoding", core::ToString(request.encoding));

        std::string job_id;
        queue::StoreError store_error;
        if (!services.EnqueueJob(job, job_id, store_error)) {
          return FailWith(error,
                          store_error.kind == queue::StoreErrorKind::kQueueFull
                              ? RpcErrorCode::kQueueFull
                              : RpcErrorCode::kInternalError,
                          store_error.message);
        }

        result = core::json::MakeObject();
        SetField(result, "success", true);
        SetField(result, "jobId", job_id);
        SetField(result, "status", "queued");
        SetCount(result, "bytes", payload.size());
        SetField(result, "timestamp", core::NowUtcTimestamp());
        return true;
      }));

  // Status queries report failures in the result instead of as errors.
  dispatcher.Register(
      "printer.getStatus",
      Typed<DeviceRequest>([&services](const RequestContext&, const DeviceRequest& request,
                                       Value& result, RpcError&) {
        printer::PrinterProbe probe;
        printer::PrintError print_error;
        const bool found = services.Printers().Probe(request.device_id, probe, print_error);
        result = core::json::MakeObject();
        SetField(result, "success", found);
        SetField(result, "deviceId", request.device_id);
        if (!found) {
          SetField(result, "error", print_error.message);
          SetField(result, "timestamp", core::NowUtcTimestamp());
          return true;
        }
        SetField(result, "status", probe.status);
        SetField(result, "isOnline", probe.is_online);
        SetCount(result, "jobsPending", CountPendingJobs(services, request.device_id));
        if (!probe.error.empty()) {
          SetField(result, "error", probe.error);
        }
        SetField(result, "timestamp", core::NowUtcTimestamp());
        return true;
      }));

  dispatcher.Register(
      "printer.getCapabilities",
      Typed<DeviceRequest>([&services](const RequestContext&, const DeviceRequest& request,
                                       Value& result, RpcError& error) {
        devices::PrinterDetail capabilities;
        printer::PrintError print_error;
        if (!services.Printers().GetCapabilities(request.device_id, capabilities,
                                                 print_error)) {
          return FailWith(error, ToRpcCode(print_error.kind), print_error.message);
        }
        result = devices::ToJson(capabilities);
        return true;
      }));
}

void RegisterBiometricMethods(Dispatcher& dispatcher, services::GatewayServices& services) {
  dispatcher.Register(
      "biometric.enroll",
      Typed<BiometricEnrollRequest>([&services](const RequestContext&,
                                                const BiometricEnrollRequest& request,
                                                Value& result, RpcError& error) {
        devices::BiometricDetail detail;
        if (!ResolveBiometric(services, request.device_id, detail, error)) {
          return false;
        }
        bool updated = false;
        std::string enroll_error;
        if (!services.Biometrics().Enroll(request.device_id, request.user_id, request.user_name,
                                          request.biometric_data, updated, enroll_error)) {
          return FailWith(error, RpcErrorCode::kValidationFailed, enroll_error);
        }
        result = core::json::MakeObject();
        SetField(result, "success", true);
        SetField(result, "deviceId", request.device_id);
        SetField(result, "userId", request.user_id);
        SetField(result, "updated", updated);
        SetField(result, "timestamp", core::NowUtcTimestamp());
        return true;
      }));

  dispatcher.Register(
      "biometric.authenticate",
      Typed<BiometricAuthenticateRequest>([&services](
                                              const RequestContext&,
                                              const BiometricAuthenticateRequest& request,
                                              Value& result, RpcError& error) {
        devices::BiometricDetail detail;
        if (!ResolveBiometric(services, request.device_id, detail, error)) {
          return false;
        }
        biometric::VerifyResult verify;
        std::string verify_error;
        if (!services.Biometrics().Authenticate(request.device_id, request.user_id,
                                                request.biometric_data, verify, verify_error)) {
          return FailWith(error, RpcErrorCode::kValidationFailed, verify_error);
        }
        result = core::json::MakeObject();
        SetField(result, "success", true);
        SetField(result, "verified", verify.verified);
        SetField(result, "confidence", verify.confidence);
        SetField(result, "userId", request.user_id);
        SetField(result, "timestamp", core::NowUtcTimestamp());
        return true;
      }));

  dispatcher.Register(
      "biometric.identify",
      Typed<BiometricIdentifyRequest>([&services](const RequestContext&,
                                                  const BiometricIdentifyRequest& request,
                                                  Value& result, RpcError& error) {
        devices::BiometricDetail detail;
        if (!ResolveBiometric(services, request.device_id, detail, error)) {
          return false;
        }
        biometric::IdentifyResult identify;
        std::string identify_error;
        if (!services.Biometrics().Identify(request.device_id, request.biometric_data, identify,
                                            identify_error)) {
          return FailWith(error, RpcErrorCode::kValidationFailed, identify_error);
        }
        result = core::json::MakeObject();
        SetField(result, "success", true);
        SetField(result, "identified", identify.identified);
        SetField(result, "confidence", identify.confidence);
        if (identify.identified) {
          SetField(result, "userId", identify.user_id);
          SetField(result, "userName", identify.user_name);
        }
        if (!identify.note.empty()) {
          SetField(result, "message", identify.note);
        }
        SetField(result, "timestamp", core::NowUtcTimestamp());
        return true;
      }));

  dispatcher.Register(
      "biometric.getStatus",
      Typed<DeviceRequest>([&services](const RequestContext&, const DeviceRequest& request,
                                       Value& result, RpcError& error) {
        devices::BiometricDetail detail;
        if (!ResolveBiometric(services, request.device_id, detail, error)) {
          return false;
        }
        result = core::json::MakeObject();
        SetField(result, "deviceId", request.device_id);
        SetField(result, "status", "available");
        SetCount(result, "enrolledUsers", services.Biometrics().UserCount(request.device_id));
        SetCount(result, "maxUsers", detail.max_users);
        result.Set("supportedModes", core::json::MakeStringArray(detail.supported_modes));
        return true;
      }));

  dispatcher.Register(
      "biometric.getUsers",
      Typed<DeviceRequest>([&services](const RequestContext&, const DeviceRequest& request,
                                       Value& result, RpcError& error) {
        devices::BiometricDetail detail;
        if (!ResolveBiometric(services, request.device_id, detail, error)) {
          return false;
        }
        const auto users = services.Biometrics().GetUsers(request.device_id);
        Value list = core::json::MakeArray();
        for (const auto& user : users) {
          list.Push(biometric::ToJson(user));
        }
        result = core::json::MakeObject();
        SetField(result, "success", true);
        result.Set("users", std::move(list));
        SetCount(result, "count", users.size());
        return true;
      }));

  dispatcher.Register(
      "biometric.deleteUser",
      Typed<BiometricUserRequest>([&services](const RequestContext&,
                                              const BiometricUserRequest& request, Value& result,
                                              RpcError& error) {
        devices::BiometricDetail detail;
        if (!ResolveBiometric(services, request.device_id, detail, error)) {
          return false;
        }
        std::string delete_error;
        if (!services.Biometrics().DeleteUser(request.device_id, request.user_id,
                                              delete_error)) {
          return FailWith(error, RpcErrorCode::kDeviceNotFound, delete_error);
        }
        result = core::json::MakeObject();
        SetField(result, "success", true);
        SetField(result, "userId", request.user_id);
        SetField(result, "deleted", true);
        return true;
      }));
}

} // namespace hwbridge::rpc
