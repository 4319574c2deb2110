#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace hwbridge::system {

// Best-effort host snapshot behind system.getInfo and system.getHealth.
// Missing platform fields keep their defaults (`unknown`, zero).
struct HostMetrics {
  std::string platform = "unknown";
  std::string os_version = "unknown";
  std::string architecture = "unknown";
  std::string hostname = "unknown";
  std::uint32_t cpu_logical_cores = 0;
  std::uint64_t ram_total_bytes = 0;
  std::uint64_t ram_available_bytes = 0;
  std::uint64_t uptime_seconds = 0;
  std::optional<double> load_avg_1m;
  // 0..100.
  double cpu_usage_percent = 0.0;
  double memory_usage_percent = 0.0;
};

// CPU usage needs two /proc/stat samples; the sampler keeps the previous one
// so each call reports usage since the last call. The first call falls back
// to load average over core count.
class HostMetricsSampler {
public:
  HostMetrics Sample();

private:
  struct CpuTimes {
    std::uint64_t busy = 0;
    std::uint64_t total = 0;
  };

  std::mutex mutex_;
  std::optional<CpuTimes> previous_;
};

std::string DetectHostname();
std::string DetectPlatform();

} // namespace hwbridge::system
