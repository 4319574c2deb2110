#include "queue/job_model.hpp"

#include "core/string_utils.hpp"
#include "core/time_utils.hpp"

namespace hwbridge::queue {

namespace {

using core::json::MakeNumber;
using core::json::MakeString;
using JsonValue = core::json::Value;

JsonValue TimestampOrNull(const std::optional<std::chrono::system_clock::time_point>& value) {
  if (!value.has_value()) {
    return core::json::MakeNull();
  }
  return MakeString(core::FormatUtcTimestamp(*value));
}

} // namespace

std::string ToString(JobStatus status) {
  switch (status) {
  case JobStatus::kPending:
    return "pending";
  case JobStatus::kProcessing:
    return "processing";
  case JobStatus::kCompleted:
    return "completed";
  case JobStatus::kFailed:
    return "failed";
  case JobStatus::kCancelled:
    return "cancelled";
  }
  return "pending";
}

bool ParseJobStatus(std::string_view raw, JobStatus& status) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  if (normalized == "pending") {
    status = JobStatus::kPending;
  } else if (normalized == "processing") {
    status = JobStatus::kProcessing;
  } else if (normalized == "completed") {
    status = JobStatus::kCompleted;
  } else if (normalized == "failed") {
    status = JobStatus::kFailed;
  } else if (normalized == "cancelled") {
    status = JobStatus::kCancelled;
  } else {
    return false;
  }
  return true;
}

JsonValue ToJson(const QueueJob& job) {
  JsonValue out = core::json::MakeObject();
  out.Set("id", MakeString(job.id));
  out.Set("deviceId", MakeString(job.device_id));
  out.Set("deviceType", MakeString(job.device_type));
  out.Set("operation", MakeString(job.operation));
  out.Set("status", MakeString(ToString(job.status)));
  out.Set("createdAt", MakeString(core::FormatUtcTimestamp(job.created_at)));
  out.Set("startedAt", TimestampOrNull(job.started_at));
  out.Set("completedAt", TimestampOrNull(job.completed_at));
  out.Set("error", job.error.has_value() ? MakeString(*job.error) : core::json::MakeNull());
  out.Set("retryCount", MakeNumber(job.retry_count));
  out.Set("parameters", job.parameters);
  return out;
}

JsonValue ToJson(const QueueStatus& status) {
  JsonValue out = core::json::MakeObject();
  out.Set("totalJobs", MakeNumber(static_cast<double>(status.total)));
  out.Set("pendingJobs", MakeNumber(static_cast<double>(status.pending)));
  out.Set("processingJobs", MakeNumber(static_cast<double>(status.processing)));
  out.Set("completedJobs", MakeNumber(static_cast<double>(status.completed)));
  out.Set("failedJobs", MakeNumber(static_cast<double>(status.failed)));
  out.Set("cancelledJobs", MakeNumber(static_cast<double>(status.cancelled)));
  out.Set("lastProcessed", TimestampOrNull(status.last_processed));
  out.Set("averageProcessingTime", MakeNumber(status.average_processing_ms));
  return out;
}

} // namespace hwbridge::queue
