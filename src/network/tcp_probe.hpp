#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace hwbridge::network {

// Dials `host:port` on `socket` and bounds the whole attempt (resolve plus
// connect) by `timeout`. On failure the socket is closed and `error` holds
// "Connection timeout" or the system message. `io` must not be running on
// another thread; it is restarted and drained before return.
bool ConnectWithTimeout(boost::asio::io_context& io, boost::asio::ip::tcp::socket& socket,
                        const std::string& host, std::uint16_t port,
                        std::chrono::milliseconds timeout, std::string& error);

struct ProbeResult {
  bool reachable = false;
  std::chrono::milliseconds response_time{0};
  std::string error;
};

// One ephemeral connect-and-close probe on a private io_context. Never throws;
// every failure is reported through the result.
ProbeResult ProbeTcp(const std::string& host, std::uint16_t port,
                     std::chrono::milliseconds timeout);

} // namespace hwbridge::network
