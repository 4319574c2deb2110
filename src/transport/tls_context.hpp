#pragma once

#include "config/gateway_config.hpp"

#include <boost/asio/ssl/context.hpp>

#include <string>

namespace hwbridge::transport {

// Loads the PEM certificate chain and key named by the config. With mutual
// TLS enabled, clients must present a certificate signed by `clientCaPath`.
bool ConfigureServerTls(const config::GatewayConfig& config, boost::asio::ssl::context& context,
                        std::string& error);

// Client side used by `hwbridge call` against wss:// URLs. Peer verification
// is on unless `insecure` is set (self-signed local certificates).
bool ConfigureClientTls(boost::asio::ssl::context& context, bool insecure, std::string& error);

} // namespace hwbridge::transport
