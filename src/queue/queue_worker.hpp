#pragma once

#include "core/logging/logger.hpp"
#include "queue/job_executor.hpp"
#include "queue/job_store.hpp"
#include "queue/retry_policy.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace hwbridge::queue {

// Called after every status change the worker makes.
using JobUpdateSink = std::function<void(const std::string& job_id, JobStatus status)>;

// Cancellable polling loop that drains the queue.
//
// Each tick claims eligible jobs one at a time until none remain, then sleeps
// for `poll_interval`. A single-flight guard keeps ticks from overlapping, so
// a slow device never has two claims in progress from this worker; the claim
// itself is atomic in the store, which protects against other workers.
class QueueWorker {
public:
  QueueWorker(boost::asio::any_io_executor executor, JobStore& store, IJobExecutor& job_executor,
              RetryPolicy policy, std::chrono::milliseconds poll_interval, JobUpdateSink sink,
              core::logging::Logger logger);

  void Start();
  void Stop();

  // Claims and runs at most one job. Returns false when nothing was eligible
  // or another pass is already running.
  bool RunOnce();

  // Runs jobs until none are eligible. Returns how many ran.
  std::size_t Drain();

private:
  void ScheduleNext(std::chrono::milliseconds delay);
  void Notify(const std::string& job_id, JobStatus status);

  // Start/Stop run on caller threads while ticks re-arm the timer on the
  // executor; every timer call goes through this lock.
  std::mutex timer_mutex_;
  boost::asio::steady_timer timer_;
  JobStore& store_;
  IJobExecutor& job_executor_;
  RetryPolicy policy_;
  std::chrono::milliseconds poll_interval_;
  JobUpdateSink sink_;
  core::logging::Logger logger_;
  std::atomic<bool> running_{false};
  std::atomic<bool> in_flight_{false};
};

} // namespace hwbridge::queue
