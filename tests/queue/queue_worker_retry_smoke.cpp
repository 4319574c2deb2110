#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "queue/job_executor.hpp"
#include "queue/job_store.hpp"
#include "queue/queue_worker.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <thread>

#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

using hwbridge::queue::JobExecutionResult;
using hwbridge::queue::JobStatus;
using hwbridge::queue::QueueJob;

// Fails each job a scripted number of times before succeeding.
class ScriptedExecutor final : public hwbridge::queue::IJobExecutor {
public:
  std::map<std::string, int> failures_before_success;
  std::map<std::string, bool> permanent;
  std::map<std::string, int> calls;

  JobExecutionResult Execute(const QueueJob& job) override {
    const std::string key = job.parameters.Find("key")->string_value;
    const int call = ++calls[key];
    if (permanent[key]) {
      return {.success = false, .retryable = false, .error = "Invalid parameters: data"};
    }
    if (call <= failures_before_success[key]) {
      return {.success = false, .retryable = true, .error = "printer offline"};
    }
    return {.success = true, .retryable = true, .error = ""};
  }
};

hwbridge::queue::NewJob KeyedJob(const std::string& key) {
  hwbridge::queue::NewJob job;
  job.device_id = "printer_test1";
  job.device_type = "printer";
  job.operation = "print";
  job.parameters.Set("key", hwbridge::core::json::MakeString(key));
  return job;
}

} // namespace

int main() {
  using hwbridge::tests::common::Fail;

  std::ostringstream log_sink;
  const hwbridge::core::logging::Logger logger(hwbridge::core::logging::LogLevel::kDebug,
                                               log_sink);
  const auto root = hwbridge::tests::common::CreateUniqueTempDir("hwbridge-worker-smoke");

  hwbridge::queue::JobStore store(root / "queue.db", logger);
  std::string open_error;
  if (!store.Open(open_error)) {
    Fail("failed to open store: " + open_error);
  }

  std::string flaky_id;
  std::string doomed_id;
  std::string invalid_id;
  hwbridge::queue::StoreError store_error;
  if (!store.AddJob(KeyedJob("flaky"), 0, flaky_id, store_error) ||
      !store.AddJob(KeyedJob("doomed"), 0, doomed_id, store_error) ||
      !store.AddJob(KeyedJob("invalid"), 0, invalid_id, store_error)) {
    Fail("failed to enqueue jobs: " + store_error.message);
  }

  ScriptedExecutor executor;
  executor.failures_before_success["flaky"] = 2;
  executor.failures_before_success["doomed"] = 100;
  executor.permanent["invalid"] = true;

  std::vector<std::pair<std::string, JobStatus>> updates;
  boost::asio::io_context io;
  hwbridge::queue::QueueWorker worker(
      io.get_executor(), store, executor,
      {.max_retry_attempts = 2, .retry_interval = std::chrono::milliseconds(0)},
      std::chrono::milliseconds(50),
      [&updates](const std::string& job_id, JobStatus status) {
        updates.emplace_back(job_id, status);
      },
      logger);

  // Retries are immediately eligible, so draining runs every attempt.
  const std::size_t ran = worker.Drain();
  if (ran != 7U) {
    Fail("expected 7 executions (flaky 3, doomed 3, invalid 1), got " + std::to_string(ran));
  }
  if (executor.calls["flaky"] != 3 || executor.calls["doomed"] != 3 ||
      executor.calls["invalid"] != 1) {
    Fail("unexpected per-job attempt counts");
  }

  std::optional<QueueJob> job;
  if (!store.GetJob(flaky_id, job, store_error) || !job.has_value() ||
      job->status != JobStatus::kCompleted || job->retry_count != 2U) {
    Fail("expected flaky job to complete after two retries");
  }
  if (!store.GetJob(doomed_id, job, store_error) || !job.has_value() ||
      job->status != JobStatus::kFailed || job->error.value_or("") != "printer offline") {
    Fail("expected doomed job to fail permanently with its last error");
  }
  if (!store.GetJob(invalid_id, job, store_error) || !job.has_value() ||
      job->status != JobStatus::kFailed || job->retry_count != 0U) {
    Fail("expected invalid job to fail without consuming retries");
  }

  bool saw_flaky_completed = false;
  std::size_t doomed_pending = 0;
  for (const auto& [job_id, status] : updates) {
    if (job_id == flaky_id && status == JobStatus::kCompleted) {
      saw_flaky_completed = true;
    }
    if (job_id == doomed_id && status == JobStatus::kPending) {
      ++doomed_pending;
    }
  }
  if (!saw_flaky_completed || doomed_pending != 2U) {
    Fail("expected job update notifications for retries and completion");
  }

  // Nothing is left to claim.
  if (worker.RunOnce()) {
    Fail("expected empty queue after drain");
  }

  hwbridge::queue::QueueStatus status;
  if (!store.GetQueueStatus(status, store_error)) {
    Fail("failed to read queue status: " + store_error.message);
  }
  if (status.completed != 1U || status.failed != 2U || status.pending != 0U) {
    Fail("unexpected queue status totals");
  }

  // Timer-driven loop picks up work enqueued after Start.
  std::string late_id;
  if (!store.AddJob(KeyedJob("late"), 0, late_id, store_error)) {
    Fail("failed to enqueue late job");
  }
  worker.Start();
  io.run_for(std::chrono::milliseconds(300));
  worker.Stop();
  io.run();
  if (executor.calls["late"] != 1) {
    Fail("expected the polling loop to run the late job once");
  }

  // Start and Stop from this thread while pool threads re-arm the timer.
  {
    std::vector<std::string> burst_ids(20);
    for (std::size_t i = 0; i < burst_ids.size(); ++i) {
      if (!store.AddJob(KeyedJob("burst-" + std::to_string(i)), 0, burst_ids[i], store_error)) {
        Fail("failed to enqueue burst job");
      }
    }
    boost::asio::thread_pool pool(2);
    hwbridge::queue::QueueWorker busy(
        pool.get_executor(), store, executor,
        {.max_retry_attempts = 0, .retry_interval = std::chrono::milliseconds(0)},
        std::chrono::milliseconds(0), nullptr, logger);
    for (int round = 0; round < 200; ++round) {
      busy.Start();
      if (round % 8 == 0) {
        std::this_thread::yield();
      }
      busy.Stop();
    }

    busy.Start();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    hwbridge::queue::QueueStatus burst_status;
    while (std::chrono::steady_clock::now() < deadline) {
      if (!store.GetQueueStatus(burst_status, store_error)) {
        Fail("failed to read queue status: " + store_error.message);
      }
      if (burst_status.pending == 0U && burst_status.processing == 0U) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    busy.Stop();
    pool.join();

    for (std::size_t i = 0; i < burst_ids.size(); ++i) {
      if (executor.calls["burst-" + std::to_string(i)] != 1) {
        Fail("expected each burst job to run exactly once");
      }
      if (!store.GetJob(burst_ids[i], job, store_error) || !job.has_value() ||
          job->status != JobStatus::kCompleted) {
        Fail("expected burst job to complete");
      }
    }
  }

  hwbridge::tests::common::AssertContains(log_sink.str(), "job failed permanently");
  hwbridge::tests::common::AssertContains(log_sink.str(), "job completed");

  store.Close();
  hwbridge::tests::common::RemovePathBestEffort(root);
  return 0;
}
