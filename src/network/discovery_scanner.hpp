#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "network/tcp_probe.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::network {

struct DiscoveryOptions {
  // Empty means the local /24 (see DetectLocalSubnet).
  std::string subnet;
  std::vector<std::uint16_t> ports = {9100, 631, 515, 4370};
  std::chrono::milliseconds timeout{2000};
  std::uint32_t max_concurrent = 50;
};

struct DiscoveredDevice {
  std::string host;
  std::uint16_t port = 0;
  std::chrono::milliseconds response_time{0};
  std::string inferred_type;
  std::string inferred_protocol;
  std::string service;
  std::chrono::system_clock::time_point timestamp{};
};

struct DiscoveryResult {
  std::string subnet;
  std::vector<DiscoveredDevice> devices;
  std::size_t probed = 0;
  // Highest number of probes in flight at once; never above max_concurrent.
  std::size_t peak_concurrency = 0;
  std::chrono::milliseconds elapsed{0};
  std::chrono::system_clock::time_point timestamp{};
};

using TcpProber = std::function<ProbeResult(const std::string& host, std::uint16_t port,
                                            std::chrono::milliseconds timeout)>;

// Upper bound on host x port pairs per scan.
inline constexpr std::size_t kMaxDiscoveryProbes = 65536;

// Expands a subnet expression into host addresses:
// - "a.b.c"      -> a.b.c.1 .. a.b.c.254
// - "a.b"        -> a.b.0.1 .. a.b.0.254 (inet_aton reading of "a.b.<i>")
// - "a.b.c.d/p"  -> usable hosts of the CIDR block, 16 <= p <= 30
// - "a.b.c.d"    -> that single host
bool ExpandSubnet(std::string_view subnet, std::vector<std::string>& hosts, std::string& error);

// Three-octet prefix of the first non-loopback IPv4 interface, else "127.0.0".
std::string DetectLocalSubnet();

// Bounded-concurrency TCP sweep. Probes run on a fixed pool of
// `max_concurrent` workers, so at most that many sockets are ever
// outstanding. Individual probe failures are dropped from the results; only
// invalid options fail the scan.
class DiscoveryScanner {
public:
  explicit DiscoveryScanner(core::logging::Logger logger, TcpProber prober = ProbeTcp);

  bool Discover(const DiscoveryOptions& options, DiscoveryResult& result, std::string& error);

private:
  core::logging::Logger logger_;
  TcpProber prober_;
};

core::json::Value ToJson(const DiscoveredDevice& device);
core::json::Value ToJson(const DiscoveryResult& result);

} // namespace hwbridge::network
