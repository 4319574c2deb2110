#include "network/discovery_scanner.hpp"

#include "core/string_utils.hpp"
#include "core/time_utils.hpp"
#include "network/well_known_ports.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <arpa/inet.h>
#include <atomic>
#include <charconv>
#include <ifaddrs.h>
#include <mutex>
#include <net/if.h>
#include <netinet/in.h>

namespace hwbridge::network {

namespace {

bool ParseOctet(std::string_view text, std::uint32_t& value) {
  if (text.empty() || text.size() > 3U) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size() && value <= 255U;
}

std::string FormatIpv4(std::uint32_t address) {
  return std::to_string((address >> 24U) & 0xFFU) + "." + std::to_string((address >> 16U) & 0xFFU) +
         "." + std::to_string((address >> 8U) & 0xFFU) + "." + std::to_string(address & 0xFFU);
}

// Sorts dotted quads numerically rather than lexically.
std::uint32_t PackIpv4(const std::string& host) {
  in_addr parsed{};
  if (inet_pton(AF_INET, host.c_str(), &parsed) != 1) {
    return 0;
  }
  return ntohl(parsed.s_addr);
}

} // namespace

bool ExpandSubnet(std::string_view subnet, std::vector<std::string>& hosts, std::string& error) {
  hosts.clear();
  const std::string trimmed = core::Trim(subnet);
  if (trimmed.empty()) {
    error = "subnet must not be empty";
    return false;
  }

  std::string address_part = trimmed;
  std::optional<std::uint32_t> prefix;
  const std::size_t slash = trimmed.find('/');
  if (slash != std::string::npos) {
    address_part = trimmed.substr(0, slash);
    std::uint32_t parsed_prefix = 0;
    const std::string prefix_text = trimmed.substr(slash + 1U);
    const auto [ptr, ec] = std::from_chars(prefix_text.data(),
                                           prefix_text.data() + prefix_text.size(), parsed_prefix);
    if (ec != std::errc() || ptr != prefix_text.data() + prefix_text.size() ||
        parsed_prefix < 16U || parsed_prefix > 30U) {
      error = "subnet prefix length must be between 16 and 30";
      return false;
    }
    prefix = parsed_prefix;
  }

  const std::vector<std::string> parts = core::SplitTrimmed(address_part, '.');
  std::vector<std::uint32_t> octets;
  for (const auto& part : parts) {
    std::uint32_t octet = 0;
    if (!ParseOctet(part, octet)) {
      error = "invalid subnet '" + trimmed + "'";
      return false;
    }
    octets.push_back(octet);
  }

  if (prefix.has_value()) {
    if (octets.size() != 4U) {
      error = "CIDR subnet must use a full a.b.c.d address";
      return false;
    }
    const std::uint32_t base =
        (octets[0] << 24U) | (octets[1] << 16U) | (octets[2] << 8U) | octets[3];
    const std::uint32_t mask = 0xFFFFFFFFU << (32U - *prefix);
    const std::uint32_t network = base & mask;
    const std::uint32_t broadcast = network | ~mask;
    for (std::uint32_t address = network + 1U; address < broadcast; ++address) {
      hosts.push_back(FormatIpv4(address));
    }
    return true;
  }

  switch (octets.size()) {
  case 2U:
    for (std::uint32_t i = 1; i <= 254U; ++i) {
      hosts.push_back(FormatIpv4((octets[0] << 24U) | (octets[1] << 16U) | i));
    }
    return true;
  case 3U:
    for (std::uint32_t i = 1; i <= 254U; ++i) {
      hosts.push_back(FormatIpv4((octets[0] << 24U) | (octets[1] << 16U) | (octets[2] << 8U) | i));
    }
    return true;
  case 4U:
    hosts.push_back(FormatIpv4((octets[0] << 24U) | (octets[1] << 16U) | (octets[2] << 8U) |
                               octets[3]));
    return true;
  default:
    error = "subnet must look like a.b, a.b.c, a.b.c.d or a.b.c.d/prefix";
    return false;
  }
}

std::string DetectLocalSubnet() {
  ifaddrs* interfaces = nullptr;
  if (getifaddrs(&interfaces) != 0) {
    return "127.0.0";
  }

  std::string subnet = "127.0.0";
  for (const ifaddrs* entry = interfaces; entry != nullptr; entry = entry->ifa_next) {
    if (entry->ifa_addr == nullptr || entry->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if ((entry->ifa_flags & IFF_LOOPBACK) != 0U || (entry->ifa_flags & IFF_UP) == 0U) {
      continue;
    }
    const auto* address = reinterpret_cast<const sockaddr_in*>(entry->ifa_addr);
    const std::uint32_t host_order = ntohl(address->sin_addr.s_addr);
    subnet = std::to_string((host_order >> 24U) & 0xFFU) + "." +
             std::to_string((host_order >> 16U) & 0xFFU) + "." +
             std::to_string((host_order >> 8U) & 0xFFU);
    break;
  }

  freeifaddrs(interfaces);
  return subnet;
}

DiscoveryScanner::DiscoveryScanner(core::logging::Logger logger, TcpProber prober)
    : logger_(std::move(logger)), prober_(std::move(prober)) {}

bool DiscoveryScanner::Discover(const DiscoveryOptions& options, DiscoveryResult& result,
                                std::string& error) {
  result = DiscoveryResult{};
  if (options.ports.empty()) {
    error = "ports must list at least one port";
    return false;
  }
  if (options.max_concurrent == 0U) {
    error = "maxConcurrent must be at least 1";
    return false;
  }
  if (options.timeout.count() <= 0) {
    error = "timeout must be positive";
    return false;
  }

  result.subnet = options.subnet.empty() ? DetectLocalSubnet() : options.subnet;
  std::vector<std::string> hosts;
  if (!ExpandSubnet(result.subnet, hosts, error)) {
    return false;
  }
  if (hosts.size() * options.ports.size() > kMaxDiscoveryProbes) {
    error = "scan too large: " + std::to_string(hosts.size() * options.ports.size()) +
            " probes exceeds limit of " + std::to_string(kMaxDiscoveryProbes);
    return false;
  }

  logger_.Info("discovery started", {{"subnet", result.subnet},
                                     {"hosts", std::to_string(hosts.size())},
                                     {"ports", std::to_string(options.ports.size())},
                                     {"max_concurrent", std::to_string(options.max_concurrent)}});

  const auto started = std::chrono::steady_clock::now();
  std::atomic<std::size_t> in_flight{0};
  std::atomic<std::size_t> peak{0};
  std::mutex results_mutex;
  std::vector<DiscoveredDevice> found;

  {
    boost::asio::thread_pool workers(options.max_concurrent);
    for (const auto& host : hosts) {
      for (const std::uint16_t port : options.ports) {
        boost::asio::post(workers, [&, host, port]() {
          const std::size_t now_in_flight = in_flight.fetch_add(1U) + 1U;
          std::size_t observed = peak.load();
          while (now_in_flight > observed && !peak.compare_exchange_weak(observed, now_in_flight)) {
          }

          const ProbeResult probe = prober_(host, port, options.timeout);
          in_flight.fetch_sub(1U);
          if (!probe.reachable) {
            return;
          }

          const PortClassification classification = ClassifyPort(port);
          DiscoveredDevice device{
              .host = host,
              .port = port,
              .response_time = probe.response_time,
              .inferred_type = std::string(classification.device_type),
              .inferred_protocol = std::string(classification.protocol),
              .service = std::string(classification.service),
              .timestamp = std::chrono::system_clock::now(),
          };
          std::lock_guard<std::mutex> lock(results_mutex);
          found.push_back(std::move(device));
        });
      }
    }
    workers.join();
  }

  std::sort(found.begin(), found.end(), [](const DiscoveredDevice& lhs, const DiscoveredDevice& rhs) {
    const std::uint32_t lhs_address = PackIpv4(lhs.host);
    const std::uint32_t rhs_address = PackIpv4(rhs.host);
    if (lhs_address != rhs_address) {
      return lhs_address < rhs_address;
    }
    return lhs.port < rhs.port;
  });

  result.devices = std::move(found);
  result.probed = hosts.size() * options.ports.size();
  result.peak_concurrency = peak.load();
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  result.timestamp = std::chrono::system_clock::now();

  logger_.Info("discovery finished", {{"subnet", result.subnet},
                                      {"found", std::to_string(result.devices.size())},
                                      {"probed", std::to_string(result.probed)},
                                      {"elapsed_ms", std::to_string(result.elapsed.count())}});
  return true;
}

core::json::Value ToJson(const DiscoveredDevice& device) {
  core::json::Value out = core::json::MakeObject();
  out.Set("host", core::json::MakeString(device.host));
  out.Set("port", core::json::MakeNumber(device.port));
  out.Set("responseTime",
          core::json::MakeNumber(static_cast<double>(device.response_time.count())));
  out.Set("inferredType", core::json::MakeString(device.inferred_type));
  out.Set("inferredProtocol", core::json::MakeString(device.inferred_protocol));
  out.Set("service", core::json::MakeString(device.service));
  out.Set("timestamp", core::json::MakeString(core::FormatUtcTimestamp(device.timestamp)));
  return out;
}

core::json::Value ToJson(const DiscoveryResult& result) {
  core::json::Value devices = core::json::MakeArray();
  for (const auto& device : result.devices) {
    devices.Push(ToJson(device));
  }
  core::json::Value out = core::json::MakeObject();
  out.Set("success", core::json::MakeBool(true));
  out.Set("subnet", core::json::MakeString(result.subnet));
  out.Set("devices", std::move(devices));
  out.Set("count", core::json::MakeNumber(static_cast<double>(result.devices.size())));
  out.Set("probed", core::json::MakeNumber(static_cast<double>(result.probed)));
  out.Set("peakConcurrency", core::json::MakeNumber(static_cast<double>(result.peak_concurrency)));
  out.Set("elapsed", core::json::MakeNumber(static_cast<double>(result.elapsed.count())));
  out.Set("timestamp", core::json::MakeString(core::FormatUtcTimestamp(result.timestamp)));
  return out;
}

} // namespace hwbridge::network
