#pragma once

#include "core/json_dom.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hwbridge::queue {

enum class JobStatus {
  kPending,
  kProcessing,
  kCompleted,
  kFailed,
  kCancelled,
};

std::string ToString(JobStatus status);
bool ParseJobStatus(std::string_view raw, JobStatus& status);

// One durable queue row. `parameters` is the opaque bag handed back to the
// operation when the job runs.
struct QueueJob {
  std::string id;
  std::string device_id;
  std::string device_type;
  std::string operation;
  JobStatus status = JobStatus::kPending;
  std::chrono::system_clock::time_point created_at{};
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> completed_at;
  std::optional<std::string> error;
  std::uint32_t retry_count = 0;
  core::json::Value parameters = core::json::MakeObject();
  // Earliest time a pending job may be claimed; pushed out by retries.
  std::chrono::system_clock::time_point available_at{};
};

struct NewJob {
  std::string device_id;
  std::string device_type;
  std::string operation;
  core::json::Value parameters = core::json::MakeObject();
};

struct QueueStatus {
  std::uint64_t total = 0;
  std::uint64_t pending = 0;
  std::uint64_t processing = 0;
  std::uint64_t completed = 0;
  std::uint64_t failed = 0;
  std::uint64_t cancelled = 0;
  std::optional<std::chrono::system_clock::time_point> last_processed;
  // Mean completedAt - startedAt over completed jobs, milliseconds.
  double average_processing_ms = 0.0;
};

core::json::Value ToJson(const QueueJob& job);
core::json::Value ToJson(const QueueStatus& status);

} // namespace hwbridge::queue
