#include "queue/queue_worker.hpp"

#include <boost/asio/error.hpp>

namespace hwbridge::queue {

QueueWorker::QueueWorker(boost::asio::any_io_executor executor, JobStore& store,
                         IJobExecutor& job_executor, RetryPolicy policy,
                         std::chrono::milliseconds poll_interval, JobUpdateSink sink,
                         core::logging::Logger logger)
    : timer_(std::move(executor)),
      store_(store),
      job_executor_(job_executor),
      policy_(policy),
      poll_interval_(poll_interval),
      sink_(std::move(sink)),
      logger_(std::move(logger)) {}

void QueueWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  logger_.Info("queue worker started",
               {{"poll_interval_ms", std::to_string(poll_interval_.count())},
                {"max_retry_attempts", std::to_string(policy_.max_retry_attempts)}});
  ScheduleNext(std::chrono::milliseconds(0));
}

void QueueWorker::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    timer_.cancel();
  }
  logger_.Info("queue worker stopped");
}

void QueueWorker::Notify(const std::string& job_id, JobStatus status) {
  if (sink_) {
    sink_(job_id, status);
  }
}

bool QueueWorker::RunOnce() {
  if (in_flight_.exchange(true)) {
    return false;
  }
  struct InFlightReset {
    std::atomic<bool>& flag;
    ~InFlightReset() {
      flag = false;
    }
  } reset{in_flight_};

  std::optional<QueueJob> job;
  StoreError store_error;
  if (!store_.ClaimNextJob(job, store_error)) {
    logger_.Error("failed to claim next job", {{"error", store_error.message}});
    return false;
  }
  if (!job.has_value()) {
    return false;
  }
  Notify(job->id, JobStatus::kProcessing);

  const auto started = std::chrono::steady_clock::now();
  const JobExecutionResult result = job_executor_.Execute(*job);
  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started)
                              .count();

  if (result.success) {
    bool applied = false;
    if (!store_.CompleteJob(job->id, applied, store_error)) {
      logger_.Error("failed to record job completion",
                    {{"job_id", job->id}, {"error", store_error.message}});
      return true;
    }
    if (applied) {
      logger_.Info("job completed", {{"job_id", job->id},
                                     {"operation", job->operation},
                                     {"elapsed_ms", std::to_string(elapsed_ms)}});
      Notify(job->id, JobStatus::kCompleted);
    }
    return true;
  }

  const std::uint32_t budget = result.retryable ? policy_.max_retry_attempts : 0U;
  FailOutcome outcome = FailOutcome::kSkipped;
  if (!store_.FailJob(job->id, result.error, budget, policy_.retry_interval, outcome,
                      store_error)) {
    logger_.Error("failed to record job failure",
                  {{"job_id", job->id}, {"error", store_error.message}});
    return true;
  }
  switch (outcome) {
  case FailOutcome::kRetryScheduled:
    logger_.Debug("job retry budget",
                  {{"job_id", job->id},
                   {"retries_remaining",
                    std::to_string(ComputeRetriesRemaining(budget, job->retry_count + 1U))}});
    Notify(job->id, JobStatus::kPending);
    break;
  case FailOutcome::kFailed:
    Notify(job->id, JobStatus::kFailed);
    break;
  case FailOutcome::kSkipped:
    break;
  }
  return true;
}

std::size_t QueueWorker::Drain() {
  std::size_t ran = 0;
  while (RunOnce()) {
    ++ran;
  }
  return ran;
}

void QueueWorker::ScheduleNext(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  // Checked under the lock so a concurrent Stop() either sees the armed timer
  // or makes this a no-op.
  if (!running_) {
    return;
  }
  timer_.expires_after(delay);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || !running_) {
      return;
    }
    Drain();
    ScheduleNext(poll_interval_);
  });
}

} // namespace hwbridge::queue
