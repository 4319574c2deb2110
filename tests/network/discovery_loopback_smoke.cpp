#include "../common/assertions.hpp"
#include "network/discovery_scanner.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using boost::asio::ip::tcp;

// Binds listeners on 127.0.0.1, .2 and .3 sharing one port. The loopback
// interface answers for the whole 127/8 block on Linux.
bool BindLoopbackTrio(boost::asio::io_context& io,
                      std::vector<std::unique_ptr<tcp::acceptor>>& acceptors,
                      std::uint16_t& port) {
  for (int attempt = 0; attempt < 20; ++attempt) {
    acceptors.clear();
    auto first = std::make_unique<tcp::acceptor>(
        io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    port = first->local_endpoint().port();
    acceptors.push_back(std::move(first));

    bool all_bound = true;
    for (const char* address : {"127.0.0.2", "127.0.0.3"}) {
      auto acceptor = std::make_unique<tcp::acceptor>(io);
      boost::system::error_code ec;
      const tcp::endpoint endpoint(boost::asio::ip::make_address(address), port);
      acceptor->open(endpoint.protocol(), ec);
      if (!ec) {
        acceptor->bind(endpoint, ec);
      }
      if (!ec) {
        acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
      }
      if (ec) {
        all_bound = false;
        break;
      }
      acceptors.push_back(std::move(acceptor));
    }
    if (all_bound) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> Hosts(const hwbridge::network::DiscoveryResult& result) {
  std::vector<std::string> hosts;
  for (const auto& device : result.devices) {
    hosts.push_back(device.host);
  }
  return hosts;
}

} // namespace

int main() {
  using hwbridge::tests::common::Fail;

  std::ostringstream log_sink;
  const hwbridge::core::logging::Logger logger(hwbridge::core::logging::LogLevel::kDebug,
                                               log_sink);

  boost::asio::io_context io;
  std::vector<std::unique_ptr<tcp::acceptor>> acceptors;
  std::uint16_t port = 0;
  if (!BindLoopbackTrio(io, acceptors, port)) {
    Fail("could not bind loopback listeners on a shared port");
  }

  const std::vector<std::string> expected = {"127.0.0.1", "127.0.0.2", "127.0.0.3"};

  // Real probes, both subnet spellings.
  for (const std::string subnet : {"127.0.0", "127.0"}) {
    hwbridge::network::DiscoveryScanner scanner(logger.Child("discovery"));
    hwbridge::network::DiscoveryOptions options;
    options.subnet = subnet;
    options.ports = {port};
    options.timeout = std::chrono::milliseconds(500);
    options.max_concurrent = 16;

    hwbridge::network::DiscoveryResult result;
    std::string error;
    if (!scanner.Discover(options, result, error)) {
      Fail("discovery failed for " + subnet + ": " + error);
    }
    if (Hosts(result) != expected) {
      Fail("expected exactly the three listening loopback hosts for " + subnet);
    }
    if (result.probed != 254U) {
      Fail("expected 254 probes for " + subnet);
    }
    if (result.peak_concurrency == 0U || result.peak_concurrency > options.max_concurrent) {
      Fail("peak concurrency outside 1..max_concurrent for " + subnet);
    }
    for (const auto& device : result.devices) {
      if (device.port != port) {
        Fail("expected discovered port to match the listener");
      }
    }
  }

  // Injected slow prober: count probes in flight ourselves.
  {
    std::atomic<int> in_flight{0};
    std::atomic<int> observed_peak{0};
    std::atomic<int> calls{0};
    hwbridge::network::DiscoveryScanner scanner(
        logger.Child("discovery"),
        [&](const std::string& host, std::uint16_t, std::chrono::milliseconds) {
          ++calls;
          const int now = ++in_flight;
          int peak = observed_peak.load();
          while (now > peak && !observed_peak.compare_exchange_weak(peak, now)) {
          }
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
          --in_flight;
          hwbridge::network::ProbeResult probe;
          probe.reachable = host == "10.1.2.50";
          probe.response_time = std::chrono::milliseconds(5);
          if (!probe.reachable) {
            probe.error = "Connection refused";
          }
          return probe;
        });

    hwbridge::network::DiscoveryOptions options;
    options.subnet = "10.1.2";
    options.ports = {9100, 631};
    options.timeout = std::chrono::milliseconds(100);
    options.max_concurrent = 4;

    hwbridge::network::DiscoveryResult result;
    std::string error;
    if (!scanner.Discover(options, result, error)) {
      Fail("scripted discovery failed: " + error);
    }
    if (calls != 508 || result.probed != 508U) {
      Fail("expected one probe per host and port");
    }
    if (observed_peak > 4 || result.peak_concurrency > 4U) {
      Fail("probes exceeded the concurrency bound");
    }
    if (result.devices.size() != 2U || result.devices.front().host != "10.1.2.50") {
      Fail("expected both ports of the one reachable host");
    }
    const auto printer = std::find_if(result.devices.begin(), result.devices.end(),
                                      [](const auto& device) { return device.port == 9100; });
    if (printer == result.devices.end() || printer->inferred_type != "printer") {
      Fail("expected port 9100 to be classified as a printer");
    }
  }

  // Invalid options fail the scan outright.
  {
    hwbridge::network::DiscoveryScanner scanner(logger.Child("discovery"));
    hwbridge::network::DiscoveryOptions options;
    options.subnet = "not-a-subnet";
    hwbridge::network::DiscoveryResult result;
    std::string error;
    if (scanner.Discover(options, result, error)) {
      Fail("expected malformed subnet to be rejected");
    }
    options.subnet = "127.0.0";
    options.ports.clear();
    if (scanner.Discover(options, result, error)) {
      Fail("expected empty port list to be rejected");
    }
  }

  return 0;
}
