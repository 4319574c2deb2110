#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace hwbridge::queue {

// Stable default budget for one job: the first attempt plus this many retries.
constexpr std::uint32_t kDefaultMaxRetryAttempts = 3U;
constexpr std::chrono::milliseconds kDefaultRetryInterval{60000};

struct RetryPolicy {
  std::uint32_t max_retry_attempts = kDefaultMaxRetryAttempts;
  std::chrono::milliseconds retry_interval = kDefaultRetryInterval;
};

// Computes remaining retries under a fixed budget.
std::uint32_t ComputeRetriesRemaining(std::uint32_t retry_limit, std::uint32_t retries_used);

// Classifies an operation error as permanent (bad parameters, wrong device
// kind). Permanent failures skip the retry budget; everything else is assumed
// to be a device that may come back.
bool IsPermanentJobError(std::string_view error_text);

} // namespace hwbridge::queue
