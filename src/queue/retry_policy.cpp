#include "queue/retry_policy.hpp"

#include "core/string_utils.hpp"

#include <string>

namespace hwbridge::queue {

std::uint32_t ComputeRetriesRemaining(const std::uint32_t retry_limit,
                                      const std::uint32_t retries_used) {
  if (retries_used >= retry_limit) {
    return 0U;
  }
  return retry_limit - retries_used;
}

bool IsPermanentJobError(std::string_view error_text) {
  if (error_text.empty()) {
    return false;
  }
  const std::string normalized = core::ToLower(std::string(error_text));
  return normalized.find("unknown operation") != std::string::npos ||
         normalized.find("invalid parameter") != std::string::npos ||
         normalized.find("not a printer") != std::string::npos ||
         normalized.find("device not found") != std::string::npos;
}

} // namespace hwbridge::queue
