#pragma once

#include "queue/job_model.hpp"

#include <string>

namespace hwbridge::queue {

struct JobExecutionResult {
  bool success = false;
  // False skips the retry budget (bad parameters, unknown operation).
  bool retryable = true;
  std::string error;
};

// Runs one claimed job against the device layer. Implementations must not
// throw; failures come back in the result.
class IJobExecutor {
public:
  virtual ~IJobExecutor() = default;
  virtual JobExecutionResult Execute(const QueueJob& job) = 0;
};

} // namespace hwbridge::queue
