#include "system/host_metrics.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string_view>
#include <thread>

#if defined(__linux__)
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace hwbridge::system {

namespace {

#if defined(__linux__)
bool ReadCpuTimes(std::uint64_t& busy, std::uint64_t& total) {
  std::ifstream input("/proc/stat");
  std::string label;
  if (!(input >> label) || label != "cpu") {
    return false;
  }
  // user nice system idle iowait irq softirq steal
  std::uint64_t fields[8] = {};
  for (auto& field : fields) {
    if (!(input >> field)) {
      return false;
    }
  }
  total = 0;
  for (const auto field : fields) {
    total += field;
  }
  const std::uint64_t idle = fields[3] + fields[4];
  busy = total - idle;
  return true;
}

std::uint64_t ReadMemAvailableBytes() {
  std::ifstream input("/proc/meminfo");
  std::string line;
  constexpr std::string_view kPrefix = "MemAvailable:";
  while (std::getline(input, line)) {
    if (line.rfind(kPrefix, 0) != 0U) {
      continue;
    }
    std::istringstream fields(line.substr(kPrefix.size()));
    std::uint64_t kib = 0;
    if (fields >> kib) {
      return kib * 1024U;
    }
  }
  return 0;
}
#endif

double ClampPercent(double value) {
  return std::clamp(value, 0.0, 100.0);
}

} // namespace

std::string DetectHostname() {
#if defined(__linux__)
  char name[256] = {};
  if (gethostname(name, sizeof(name)) == 0) {
    name[sizeof(name) - 1U] = '\0';
    return std::string(name);
  }
#endif
  return "unknown";
}

std::string DetectPlatform() {
#if defined(__linux__)
  return "linux";
#elif defined(__APPLE__)
  return "darwin";
#elif defined(_WIN32)
  return "win32";
#else
  return "unknown";
#endif
}

HostMetrics HostMetricsSampler::Sample() {
  HostMetrics metrics;
  metrics.platform = DetectPlatform();
  metrics.hostname = DetectHostname();
  metrics.cpu_logical_cores = std::max(1U, std::thread::hardware_concurrency());

#if defined(__linux__)
  struct utsname uts{};
  if (uname(&uts) == 0) {
    metrics.os_version = uts.release;
    metrics.architecture = uts.machine;
  }

  struct sysinfo info{};
  if (sysinfo(&info) == 0) {
    metrics.ram_total_bytes =
        static_cast<std::uint64_t>(info.totalram) * static_cast<std::uint64_t>(info.mem_unit);
    if (info.uptime >= 0) {
      metrics.uptime_seconds = static_cast<std::uint64_t>(info.uptime);
    }
    metrics.ram_available_bytes = ReadMemAvailableBytes();
    if (metrics.ram_available_bytes == 0U) {
      metrics.ram_available_bytes = static_cast<std::uint64_t>(info.freeram) *
                                    static_cast<std::uint64_t>(info.mem_unit);
    }
  }
  if (metrics.ram_total_bytes > 0U) {
    const double used =
        static_cast<double>(metrics.ram_total_bytes - std::min(metrics.ram_available_bytes,
                                                                metrics.ram_total_bytes));
    metrics.memory_usage_percent =
        ClampPercent(used * 100.0 / static_cast<double>(metrics.ram_total_bytes));
  }

  double loads[3] = {0.0, 0.0, 0.0};
  if (getloadavg(loads, 3) == 3) {
    metrics.load_avg_1m = loads[0];
  }

  CpuTimes current;
  const bool have_current = ReadCpuTimes(current.busy, current.total);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (have_current && previous_.has_value() && current.total > previous_->total &&
        current.busy >= previous_->busy) {
      const double busy_delta = static_cast<double>(current.busy - previous_->busy);
      const double total_delta = static_cast<double>(current.total - previous_->total);
      metrics.cpu_usage_percent = ClampPercent(busy_delta * 100.0 / total_delta);
    } else if (metrics.load_avg_1m.has_value()) {
      metrics.cpu_usage_percent = ClampPercent(*metrics.load_avg_1m * 100.0 /
                                               static_cast<double>(metrics.cpu_logical_cores));
    }
    if (have_current) {
      previous_ = current;
    }
  }
#endif
  return metrics;
}

} // namespace hwbridge::system
