#include "services/device_job_executor.hpp"

#include "core/json_fields.hpp"
#include "queue/retry_policy.hpp"

#include <string>

namespace hwbridge::services {

namespace {

queue::JobExecutionResult Failure(std::string error, bool retryable) {
  return queue::JobExecutionResult{
      .success = false,
      .retryable = retryable && !queue::IsPermanentJobError(error),
      .error = std::move(error),
  };
}

// Reads `data` + optional `encoding` back out of the stored parameters.
bool DecodeJobPayload(const core::json::Value& parameters,
                      core::PayloadEncoding default_encoding, core::Bytes& bytes,
                      std::string& error) {
  std::string data;
  std::string raw_encoding;
  std::string field_error;
  if (!core::json::ReadString(parameters, "data", data, true, field_error) ||
      !core::json::ReadString(parameters, "encoding", raw_encoding, false, field_error)) {
    error = "Invalid parameters: " + field_error;
    return false;
  }
  core::PayloadEncoding encoding = default_encoding;
  if (!raw_encoding.empty() && !core::ParsePayloadEncoding(raw_encoding, encoding, field_error)) {
    error = "Invalid parameters: " + field_error;
    return false;
  }
  if (!core::DecodePayload(data, encoding, bytes, field_error)) {
    error = "Invalid parameters: " + field_error;
    return false;
  }
  return true;
}

bool IsRetryable(sessions::SessionErrorKind kind) {
  return kind == sessions::SessionErrorKind::kNotConnected ||
         kind == sessions::SessionErrorKind::kIo;
}

} // namespace

DeviceJobExecutor::DeviceJobExecutor(printer::PrinterService& printers,
                                     sessions::SessionManager& sessions,
                                     core::logging::Logger logger)
    : printers_(printers), sessions_(sessions), logger_(std::move(logger)) {}

queue::JobExecutionResult DeviceJobExecutor::Execute(const queue::QueueJob& job) {
  logger_.Debug("executing job", {{"job_id", job.id},
                                  {"operation", job.operation},
                                  {"device_id", job.device_id},
                                  {"retry_count", std::to_string(job.retry_count)}});
  if (job.operation == kOperationPrint) {
    return RunPrint(job);
  }
  if (job.operation == kOperationSerialSend) {
    return RunSend(job, devices::DeviceType::kSerial);
  }
  if (job.operation == kOperationNetworkSend) {
    return RunSend(job, devices::DeviceType::kNetwork);
  }
  if (job.operation == kOperationUsbSendReport) {
    return RunSendReport(job);
  }
  return Failure("Unknown operation: " + job.operation, false);
}

queue::JobExecutionResult DeviceJobExecutor::RunPrint(const queue::QueueJob& job) {
  core::Bytes payload;
  std::string error;
  if (!DecodeJobPayload(job.parameters, core::PayloadEncoding::kUtf8, payload, error)) {
    return Failure(std::move(error), false);
  }
  std::string raw_format;
  std::string field_error;
  if (!core::json::ReadString(job.parameters, "format", raw_format, false, field_error)) {
    return Failure("Invalid parameters: " + field_error, false);
  }
  printer::PrintFormat format = printer::PrintFormat::kRaw;
  if (!printer::ParsePrintFormat(raw_format, format)) {
    return Failure("Invalid parameters: unsupported print format '" + raw_format + "'", false);
  }

  std::size_t bytes_printed = 0;
  printer::PrintError print_error;
  if (!printers_.Print(job.device_id, format, payload, bytes_printed, print_error)) {
    return Failure(print_error.message, print_error.kind == printer::PrintErrorKind::kIo);
  }
  return queue::JobExecutionResult{.success = true};
}

queue::JobExecutionResult DeviceJobExecutor::RunSend(const queue::QueueJob& job,
                                                     devices::DeviceType type) {
  core::Bytes payload;
  std::string error;
  if (!DecodeJobPayload(job.parameters, core::PayloadEncoding::kUtf8, payload, error)) {
    return Failure(std::move(error), false);
  }
  std::size_t written = 0;
  sessions::SessionError session_error;
  if (!sessions_.Send(job.device_id, type, payload, written, session_error)) {
    return Failure(session_error.message, IsRetryable(session_error.kind));
  }
  return queue::JobExecutionResult{.success = true};
}

queue::JobExecutionResult DeviceJobExecutor::RunSendReport(const queue::QueueJob& job) {
  core::Bytes payload;
  std::string error;
  if (!DecodeJobPayload(job.parameters, core::PayloadEncoding::kHex, payload, error)) {
    return Failure(std::move(error), false);
  }
  std::int64_t report_id = 0;
  std::string field_error;
  if (!core::json::ReadBoundedInteger(job.parameters, "reportId", 0, 255, report_id, false,
                                      field_error)) {
    return Failure("Invalid parameters: " + field_error, false);
  }
  std::size_t written = 0;
  sessions::SessionError session_error;
  if (!sessions_.SendReport(job.device_id, static_cast<std::uint8_t>(report_id), payload, written,
                            session_error)) {
    return Failure(session_error.message, IsRetryable(session_error.kind));
  }
  return queue::JobExecutionResult{.success = true};
}

} // namespace hwbridge::services
