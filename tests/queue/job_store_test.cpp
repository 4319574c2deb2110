#include "../common/temp_dir.hpp"
#include "queue/job_store.hpp"

#include <catch2/catch_test_macros.hpp>
#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using hwbridge::queue::FailOutcome;
using hwbridge::queue::JobStatus;
using hwbridge::queue::JobStore;
using hwbridge::queue::NewJob;
using hwbridge::queue::QueueJob;
using hwbridge::queue::StoreError;
using hwbridge::queue::StoreErrorKind;

namespace {

hwbridge::core::logging::Logger QuietLogger() {
  static std::ostringstream sink;
  return hwbridge::core::logging::Logger(hwbridge::core::logging::LogLevel::kError, sink);
}

NewJob PrintJob(const std::string& device_id) {
  NewJob job;
  job.device_id = device_id;
  job.device_type = "printer";
  job.operation = "print";
  job.parameters.Set("data", hwbridge::core::json::MakeString("hello"));
  return job;
}

struct StoreFixture {
  StoreFixture()
      : root(hwbridge::tests::common::CreateUniqueTempDir("hwbridge-job-store")),
        store(root / "nested" / "queue.db", QuietLogger()) {
    std::string error;
    REQUIRE(store.Open(error));
  }
  ~StoreFixture() {
    store.Close();
    hwbridge::tests::common::RemovePathBestEffort(root);
  }

  std::string Add(const std::string& device_id) {
    std::string id;
    StoreError error;
    REQUIRE(store.AddJob(PrintJob(device_id), 0, id, error));
    return id;
  }

  std::filesystem::path root;
  JobStore store;
};

} // namespace

TEST_CASE_METHOD(StoreFixture, "Jobs are claimed in FIFO order exactly once", "[queue][store]") {
  const auto before =
      std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  const std::string first = Add("printer_1");
  const auto after = std::chrono::system_clock::now();
  const std::string second = Add("p2");
  REQUIRE(first != second);

  std::optional<QueueJob> peek;
  StoreError error;
  REQUIRE(store.GetNextPendingJob(peek, error));
  REQUIRE(peek.has_value());
  REQUIRE(peek->id == first);
  REQUIRE(peek->device_id == "printer_1");
  REQUIRE(peek->device_type == "printer");
  REQUIRE(peek->operation == "print");
  REQUIRE(peek->status == JobStatus::kPending);
  REQUIRE(peek->retry_count == 0U);
  REQUIRE(peek->created_at >= before);
  REQUIRE(peek->created_at <= after);
  REQUIRE_FALSE(peek->started_at.has_value());
  REQUIRE_FALSE(peek->completed_at.has_value());
  REQUIRE_FALSE(peek->error.has_value());
  REQUIRE(hwbridge::core::json::Serialize(peek->parameters) == R"({"data":"hello"})");

  std::optional<QueueJob> claimed;
  REQUIRE(store.ClaimNextJob(claimed, error));
  REQUIRE(claimed->id == first);
  REQUIRE(claimed->status == JobStatus::kProcessing);
  REQUIRE(claimed->started_at.has_value());

  REQUIRE(store.ClaimNextJob(claimed, error));
  REQUIRE(claimed->id == second);
  REQUIRE(store.ClaimNextJob(claimed, error));
  REQUIRE_FALSE(claimed.has_value());
}

TEST_CASE_METHOD(StoreFixture, "Failures retry until the budget is spent", "[queue][store]") {
  const std::string id = Add("p1");
  std::optional<QueueJob> claimed;
  StoreError error;
  FailOutcome outcome = FailOutcome::kSkipped;

  for (int attempt = 0; attempt < 2; ++attempt) {
    REQUIRE(store.ClaimNextJob(claimed, error));
    REQUIRE(claimed.has_value());
    REQUIRE(store.FailJob(id, "paper jam", 2, std::chrono::milliseconds(0), outcome, error));
    REQUIRE(outcome == FailOutcome::kRetryScheduled);
  }

  REQUIRE(store.ClaimNextJob(claimed, error));
  REQUIRE(claimed->retry_count == 2U);
  REQUIRE(store.FailJob(id, "paper jam", 2, std::chrono::milliseconds(0), outcome, error));
  REQUIRE(outcome == FailOutcome::kFailed);

  std::optional<QueueJob> job;
  REQUIRE(store.GetJob(id, job, error));
  REQUIRE(job->status == JobStatus::kFailed);
  REQUIRE(job->error.value() == "paper jam");
  REQUIRE(job->completed_at.has_value());
}

TEST_CASE_METHOD(StoreFixture, "Retry delay hides a job from claimers", "[queue][store]") {
  const std::string id = Add("p1");
  std::optional<QueueJob> claimed;
  StoreError error;
  FailOutcome outcome = FailOutcome::kSkipped;
  REQUIRE(store.ClaimNextJob(claimed, error));
  REQUIRE(store.FailJob(id, "offline", 3, std::chrono::minutes(10), outcome, error));
  REQUIRE(outcome == FailOutcome::kRetryScheduled);

  REQUIRE(store.ClaimNextJob(claimed, error));
  REQUIRE_FALSE(claimed.has_value());
}

TEST_CASE_METHOD(StoreFixture, "Cancel wins over a late completion", "[queue][store]") {
  const std::string id = Add("p1");
  std::optional<QueueJob> claimed;
  StoreError error;
  REQUIRE(store.ClaimNextJob(claimed, error));

  bool cancelled = false;
  REQUIRE(store.CancelJob(id, cancelled, error));
  REQUIRE(cancelled);

  bool applied = true;
  REQUIRE(store.CompleteJob(id, applied, error));
  REQUIRE_FALSE(applied);

  REQUIRE(store.CancelJob(id, cancelled, error));
  REQUIRE_FALSE(cancelled);

  REQUIRE_FALSE(store.CancelJob("no-such-job", cancelled, error));
  REQUIRE(error.kind == StoreErrorKind::kNotFound);
}

TEST_CASE_METHOD(StoreFixture, "Active job bound rejects new work", "[queue][store]") {
  std::string id;
  StoreError error;
  REQUIRE(store.AddJob(PrintJob("p1"), 2, id, error));
  REQUIRE(store.AddJob(PrintJob("p1"), 2, id, error));
  REQUIRE_FALSE(store.AddJob(PrintJob("p1"), 2, id, error));
  REQUIRE(error.kind == StoreErrorKind::kQueueFull);
}

TEST_CASE_METHOD(StoreFixture, "Status totals equal the per-status sum", "[queue][store]") {
  const std::string done = Add("p1");
  Add("p2");
  const std::string gone = Add("p3");

  std::optional<QueueJob> claimed;
  StoreError error;
  REQUIRE(store.ClaimNextJob(claimed, error));
  bool applied = false;
  REQUIRE(store.CompleteJob(done, applied, error));
  REQUIRE(applied);
  bool cancelled = false;
  REQUIRE(store.CancelJob(gone, cancelled, error));

  hwbridge::queue::QueueStatus status;
  REQUIRE(store.GetQueueStatus(status, error));
  REQUIRE(status.total == 3U);
  REQUIRE(status.completed == 1U);
  REQUIRE(status.pending == 1U);
  REQUIRE(status.cancelled == 1U);
  REQUIRE(status.total == status.pending + status.processing + status.completed + status.failed +
                              status.cancelled);
  REQUIRE(status.last_processed.has_value());
}

TEST_CASE_METHOD(StoreFixture, "Listing filters and returns newest first", "[queue][store]") {
  const std::string older = Add("p1");
  Add("p2");
  const std::string newer = Add("p1");

  std::vector<QueueJob> jobs;
  StoreError error;
  hwbridge::queue::JobFilter filter;
  filter.device_id = "p1";
  REQUIRE(store.GetJobs(filter, jobs, error));
  REQUIRE(jobs.size() == 2U);
  REQUIRE(jobs[0].id == newer);
  REQUIRE(jobs[1].id == older);

  filter = {};
  filter.status = JobStatus::kCompleted;
  REQUIRE(store.GetJobs(filter, jobs, error));
  REQUIRE(jobs.empty());
}

TEST_CASE_METHOD(StoreFixture, "Status filter returns only rows in that status", "[queue][store]") {
  const std::string first = Add("p1");
  const std::string second = Add("p2");
  Add("p3");
  StoreError error;
  std::optional<QueueJob> claimed;
  REQUIRE(store.ClaimNextJob(claimed, error));
  REQUIRE(store.ClaimNextJob(claimed, error));

  std::vector<QueueJob> jobs;
  hwbridge::queue::JobFilter filter;
  filter.status = JobStatus::kProcessing;
  REQUIRE(store.GetJobs(filter, jobs, error));
  REQUIRE(jobs.size() == 2U);
  for (const auto& job : jobs) {
    REQUIRE(job.status == JobStatus::kProcessing);
  }
  REQUIRE(jobs[0].id == second);
  REQUIRE(jobs[1].id == first);

  filter.status = JobStatus::kPending;
  REQUIRE(store.GetJobs(filter, jobs, error));
  REQUIRE(jobs.size() == 1U);
  REQUIRE(jobs[0].status == JobStatus::kPending);
  REQUIRE(jobs[0].device_id == "p3");
}

TEST_CASE_METHOD(StoreFixture, "Status updates follow the job lifecycle", "[queue][store]") {
  const std::string id = Add("p1");
  StoreError error;
  std::optional<QueueJob> job;

  SECTION("pending to processing to completed") {
    REQUIRE(store.UpdateJobStatus(id, JobStatus::kProcessing, std::nullopt, 3, error));
    REQUIRE(store.GetJob(id, job, error));
    REQUIRE(job->status == JobStatus::kProcessing);
    REQUIRE(job->started_at.has_value());

    REQUIRE(store.UpdateJobStatus(id, JobStatus::kCompleted, std::nullopt, 3, error));
    REQUIRE(store.GetJob(id, job, error));
    REQUIRE(job->status == JobStatus::kCompleted);
    REQUIRE(job->completed_at.has_value());

    // Completed is terminal.
    REQUIRE_FALSE(store.UpdateJobStatus(id, JobStatus::kCancelled, std::nullopt, 3, error));
    REQUIRE(error.kind == StoreErrorKind::kInvalidTransition);
    REQUIRE_FALSE(store.UpdateJobStatus(id, JobStatus::kPending, std::nullopt, 3, error));
    REQUIRE(error.kind == StoreErrorKind::kInvalidTransition);
    REQUIRE(store.GetJob(id, job, error));
    REQUIRE(job->status == JobStatus::kCompleted);
  }

  SECTION("pending cannot skip processing") {
    REQUIRE_FALSE(store.UpdateJobStatus(id, JobStatus::kCompleted, std::nullopt, 3, error));
    REQUIRE(error.kind == StoreErrorKind::kInvalidTransition);
    REQUIRE_FALSE(store.UpdateJobStatus(id, JobStatus::kFailed, "jam", 3, error));
    REQUIRE(error.kind == StoreErrorKind::kInvalidTransition);
    REQUIRE_FALSE(store.UpdateJobStatus(id, JobStatus::kPending, std::nullopt, 3, error));
    REQUIRE(error.kind == StoreErrorKind::kInvalidTransition);
  }

  SECTION("failed resets to pending until the retry limit") {
    for (std::uint32_t attempt = 1; attempt <= 2U; ++attempt) {
      REQUIRE(store.UpdateJobStatus(id, JobStatus::kProcessing, std::nullopt, 2, error));
      REQUIRE(store.UpdateJobStatus(id, JobStatus::kFailed, "jam", 2, error));
      REQUIRE(store.UpdateJobStatus(id, JobStatus::kPending, std::nullopt, 2, error));
      REQUIRE(store.GetJob(id, job, error));
      REQUIRE(job->status == JobStatus::kPending);
      REQUIRE(job->retry_count == attempt);
      REQUIRE_FALSE(job->started_at.has_value());
      REQUIRE_FALSE(job->completed_at.has_value());
    }

    REQUIRE(store.UpdateJobStatus(id, JobStatus::kProcessing, std::nullopt, 2, error));
    REQUIRE(store.UpdateJobStatus(id, JobStatus::kFailed, "jam", 2, error));
    REQUIRE_FALSE(store.UpdateJobStatus(id, JobStatus::kPending, std::nullopt, 2, error));
    REQUIRE(error.kind == StoreErrorKind::kInvalidTransition);
    REQUIRE(error.message.find("retry limit") != std::string::npos);

    REQUIRE(store.GetJob(id, job, error));
    REQUIRE(job->status == JobStatus::kFailed);
    REQUIRE(job->retry_count == 2U);
    REQUIRE(job->error.value() == "jam");

    // Failed is not cancellable either.
    REQUIRE_FALSE(store.UpdateJobStatus(id, JobStatus::kCancelled, std::nullopt, 2, error));
    REQUIRE(error.kind == StoreErrorKind::kInvalidTransition);
  }

  SECTION("pending and processing jobs can be cancelled") {
    REQUIRE(store.UpdateJobStatus(id, JobStatus::kCancelled, std::nullopt, 3, error));
    const std::string running = Add("p2");
    REQUIRE(store.UpdateJobStatus(running, JobStatus::kProcessing, std::nullopt, 3, error));
    REQUIRE(store.UpdateJobStatus(running, JobStatus::kCancelled, std::nullopt, 3, error));
    REQUIRE(store.GetJob(running, job, error));
    REQUIRE(job->status == JobStatus::kCancelled);

    REQUIRE_FALSE(store.UpdateJobStatus(id, JobStatus::kProcessing, std::nullopt, 3, error));
    REQUIRE(error.kind == StoreErrorKind::kInvalidTransition);
  }

  SECTION("unknown ids are not found") {
    REQUIRE_FALSE(store.UpdateJobStatus("no-such-job", JobStatus::kProcessing, std::nullopt, 3,
                                        error));
    REQUIRE(error.kind == StoreErrorKind::kNotFound);
  }
}

TEST_CASE_METHOD(StoreFixture, "Totals match per-status counts across status updates",
                 "[queue][store]") {
  std::vector<std::string> ids;
  for (int i = 0; i < 6; ++i) {
    ids.push_back(Add("p" + std::to_string(i)));
  }
  StoreError error;
  REQUIRE(store.UpdateJobStatus(ids[0], JobStatus::kProcessing, std::nullopt, 1, error));
  REQUIRE(store.UpdateJobStatus(ids[0], JobStatus::kCompleted, std::nullopt, 1, error));
  REQUIRE(store.UpdateJobStatus(ids[1], JobStatus::kProcessing, std::nullopt, 1, error));
  REQUIRE(store.UpdateJobStatus(ids[1], JobStatus::kFailed, "offline", 1, error));
  REQUIRE(store.UpdateJobStatus(ids[1], JobStatus::kPending, std::nullopt, 1, error));
  REQUIRE(store.UpdateJobStatus(ids[2], JobStatus::kProcessing, std::nullopt, 1, error));
  REQUIRE(store.UpdateJobStatus(ids[2], JobStatus::kFailed, "offline", 1, error));
  REQUIRE(store.UpdateJobStatus(ids[3], JobStatus::kCancelled, std::nullopt, 1, error));
  REQUIRE(store.UpdateJobStatus(ids[4], JobStatus::kProcessing, std::nullopt, 1, error));
  REQUIRE_FALSE(store.UpdateJobStatus(ids[3], JobStatus::kCompleted, std::nullopt, 1, error));

  hwbridge::queue::QueueStatus status;
  REQUIRE(store.GetQueueStatus(status, error));
  REQUIRE(status.total == 6U);
  REQUIRE(status.pending == 2U);
  REQUIRE(status.processing == 1U);
  REQUIRE(status.completed == 1U);
  REQUIRE(status.failed == 1U);
  REQUIRE(status.cancelled == 1U);
  REQUIRE(status.total == status.pending + status.processing + status.completed + status.failed +
                              status.cancelled);
}

TEST_CASE_METHOD(StoreFixture, "An unreadable claimed row is marked failed", "[queue][store]") {
  Add("p1");
  {
    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open((root / "nested" / "queue.db").string().c_str(), &raw) == SQLITE_OK);
    REQUIRE(sqlite3_exec(raw, "UPDATE queue_jobs SET parameters = '{broken'", nullptr, nullptr,
                         nullptr) == SQLITE_OK);
    sqlite3_close(raw);
  }

  std::optional<QueueJob> claimed;
  StoreError error;
  REQUIRE_FALSE(store.ClaimNextJob(claimed, error));
  REQUIRE_FALSE(claimed.has_value());
  REQUIRE(error.message.find("corrupt parameters") != std::string::npos);

  hwbridge::queue::QueueStatus status;
  REQUIRE(store.GetQueueStatus(status, error));
  REQUIRE(status.processing == 0U);
  REQUIRE(status.failed == 1U);

  // Nothing is left to claim.
  REQUIRE(store.ClaimNextJob(claimed, error));
  REQUIRE_FALSE(claimed.has_value());
}

TEST_CASE("Processing rows are recovered when the store reopens", "[queue][store]") {
  const auto root = hwbridge::tests::common::CreateUniqueTempDir("hwbridge-job-recover");
  const auto path = root / "queue.db";
  std::string id;
  {
    JobStore store(path, QuietLogger());
    std::string open_error;
    REQUIRE(store.Open(open_error));
    StoreError error;
    REQUIRE(store.AddJob(PrintJob("p1"), 0, id, error));
    std::optional<QueueJob> claimed;
    REQUIRE(store.ClaimNextJob(claimed, error));
  }
  {
    JobStore store(path, QuietLogger());
    std::string open_error;
    REQUIRE(store.Open(open_error));
    std::size_t recovered = 0;
    StoreError error;
    REQUIRE(store.RecoverStaleJobs(3, recovered, error));
    REQUIRE(recovered == 1U);
    std::optional<QueueJob> job;
    REQUIRE(store.GetJob(id, job, error));
    REQUIRE(job->status == JobStatus::kPending);
    REQUIRE(job->retry_count == 1U);
  }
  hwbridge::tests::common::RemovePathBestEffort(root);
}
