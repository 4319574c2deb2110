#pragma once

#include "core/logging/logger.hpp"
#include "queue/job_model.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace hwbridge::queue {

enum class StoreErrorKind {
  kStorage,
  kNotFound,
  kQueueFull,
  // The requested status change is not an edge of the job lifecycle.
  kInvalidTransition,
};

struct StoreError {
  StoreErrorKind kind = StoreErrorKind::kStorage;
  std::string message;
};

struct JobFilter {
  std::optional<std::string> device_id;
  std::optional<JobStatus> status;
  std::size_t limit = 100;
};

enum class FailOutcome {
  kRetryScheduled,
  kFailed,
  // The job was no longer processing (cancelled meanwhile); left untouched.
  kSkipped,
};

// SQLite-backed durable job queue.
//
// Rows live in `queue_jobs`. Every state change is one SQL statement, so a
// crash never leaves a half-applied transition:
// - ClaimNextJob is a single UPDATE ... RETURNING on the oldest eligible
//   pending row; two claimers can never receive the same job.
// - FailJob moves processing -> pending with retry_count+1 and a pushed-out
//   available_at, or -> failed once the budget is spent, in one UPDATE.
// One connection serves all threads behind `mutex_`.
class JobStore {
public:
  JobStore(std::filesystem::path database_path, core::logging::Logger logger);
  ~JobStore();

  JobStore(const JobStore&) = delete;
  JobStore& operator=(const JobStore&) = delete;

  // Creates the parent directory, schema and indexes. Failure is fatal for
  // the server.
  bool Open(std::string& error);
  void Close();
  bool IsOpen() const;

  // `max_active` bounds pending + processing rows; zero disables the bound.
  bool AddJob(const NewJob& job, std::size_t max_active, std::string& job_id, StoreError& error);

  bool GetNextPendingJob(std::optional<QueueJob>& job, StoreError& error);
  bool ClaimNextJob(std::optional<QueueJob>& job, StoreError& error);

  // Applies one lifecycle edge and rejects every other change with
  // kInvalidTransition:
  // - pending -> processing (stamps startedAt)
  // - processing -> completed | failed (stamps completedAt)
  // - pending | processing -> cancelled
  // - failed -> pending, only while retryCount < max_retry_attempts; bumps
  //   retryCount and clears both stamps in the same statement
  bool UpdateJobStatus(const std::string& job_id, JobStatus status,
                       const std::optional<std::string>& job_error,
                       std::uint32_t max_retry_attempts, StoreError& error);

  // Marks a processing job completed. `applied` is false when the job left
  // processing in the meantime (cancelled).
  bool CompleteJob(const std::string& job_id, bool& applied, StoreError& error);

  bool FailJob(const std::string& job_id, const std::string& job_error,
               std::uint32_t max_retry_attempts, std::chrono::milliseconds retry_delay,
               FailOutcome& outcome, StoreError& error);

  // Cancels a pending or processing job. Jobs in a terminal state report
  // `cancelled == false`; unknown ids are kNotFound.
  bool CancelJob(const std::string& job_id, bool& cancelled, StoreError& error);

  bool GetJob(const std::string& job_id, std::optional<QueueJob>& job, StoreError& error);
  bool GetJobs(const JobFilter& filter, std::vector<QueueJob>& jobs, StoreError& error);
  bool GetQueueStatus(QueueStatus& status, StoreError& error);
  bool CountActive(std::size_t& count, StoreError& error);

  // Startup recovery: rows still `processing` belonged to a previous process.
  // They go back to pending as a retry, or to failed when over budget.
  bool RecoverStaleJobs(std::uint32_t max_retry_attempts, std::size_t& recovered,
                        StoreError& error);

private:
  bool ExecLocked(const char* sql, std::string& error);
  bool CountActiveLocked(std::size_t& count, StoreError& error);

  std::filesystem::path database_path_;
  core::logging::Logger logger_;
  mutable std::mutex mutex_;
  sqlite3* db_ = nullptr;
};

} // namespace hwbridge::queue
