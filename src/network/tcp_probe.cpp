#include "network/tcp_probe.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/address.hpp>

#include <optional>
#include <vector>

namespace hwbridge::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

// Cancels outstanding work and drains handlers so `io` can be reused.
void AbortAndDrain(asio::io_context& io, tcp::socket& socket, tcp::resolver* resolver) {
  boost::system::error_code ignored;
  if (resolver != nullptr) {
    resolver->cancel();
  }
  socket.close(ignored);
  io.restart();
  io.run();
}

} // namespace

bool ConnectWithTimeout(asio::io_context& io, tcp::socket& socket, const std::string& host,
                        std::uint16_t port, std::chrono::milliseconds timeout,
                        std::string& error) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  io.restart();

  tcp::resolver resolver(io);
  std::optional<boost::system::error_code> resolve_result;
  std::vector<tcp::endpoint> endpoints;

  boost::system::error_code address_ec;
  const auto literal = asio::ip::make_address(host, address_ec);
  if (!address_ec) {
    endpoints.emplace_back(literal, port);
  } else {
    resolver.async_resolve(host, std::to_string(port),
                           [&](const boost::system::error_code& ec,
                               const tcp::resolver::results_type& results) {
                             resolve_result = ec;
                             for (const auto& entry : results) {
                               endpoints.push_back(entry.endpoint());
                             }
                           });
    io.run_until(deadline);
    if (!resolve_result.has_value()) {
      AbortAndDrain(io, socket, &resolver);
      error = "Connection timeout";
      return false;
    }
    if (*resolve_result) {
      error = "failed to resolve host '" + host + "': " + resolve_result->message();
      io.restart();
      return false;
    }
    io.restart();
  }

  std::optional<boost::system::error_code> connect_result;
  asio::async_connect(socket, endpoints,
                      [&](const boost::system::error_code& ec, const tcp::endpoint&) {
                        connect_result = ec;
                      });
  io.run_until(deadline);
  if (!connect_result.has_value()) {
    AbortAndDrain(io, socket, nullptr);
    error = "Connection timeout";
    return false;
  }
  io.restart();
  if (*connect_result) {
    boost::system::error_code ignored;
    socket.close(ignored);
    error = connect_result->message();
    return false;
  }
  return true;
}

ProbeResult ProbeTcp(const std::string& host, std::uint16_t port,
                     std::chrono::milliseconds timeout) {
  ProbeResult result;
  asio::io_context io;
  tcp::socket socket(io);

  const auto started = std::chrono::steady_clock::now();
  std::string error;
  const bool connected = ConnectWithTimeout(io, socket, host, port, timeout, error);
  result.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (!connected) {
    result.error = std::move(error);
    return result;
  }

  result.reachable = true;
  boost::system::error_code ignored;
  socket.shutdown(tcp::socket::shutdown_both, ignored);
  socket.close(ignored);
  return result;
}

} // namespace hwbridge::network
