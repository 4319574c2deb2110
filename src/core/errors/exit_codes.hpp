#pragma once

namespace hwbridge::core::errors {

// Stable process-exit contract for service managers and scripts.
//
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Higher values let supervisors tell a bad config file apart from a port that
// could not be bound or a queue database that could not be opened.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kStartupFailed = 20,
  kRpcCallFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace hwbridge::core::errors
