#include "transport/tls_context.hpp"

#include <boost/system/error_code.hpp>

namespace hwbridge::transport {

namespace ssl = boost::asio::ssl;

bool ConfigureServerTls(const config::GatewayConfig& config, ssl::context& context,
                        std::string& error) {
  boost::system::error_code ec;
  context.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 | ssl::context::no_tlsv1 |
                          ssl::context::no_tlsv1_1 | ssl::context::single_dh_use,
                      ec);
  if (ec) {
    error = "failed to set TLS options: " + ec.message();
    return false;
  }
  context.use_certificate_chain_file(config.cert_path, ec);
  if (ec) {
    error = "failed to load certificate '" + config.cert_path + "': " + ec.message();
    return false;
  }
  context.use_private_key_file(config.key_path, ssl::context::pem, ec);
  if (ec) {
    error = "failed to load private key '" + config.key_path + "': " + ec.message();
    return false;
  }

  if (config.enable_mutual_tls) {
    context.load_verify_file(config.client_ca_path, ec);
    if (ec) {
      error = "failed to load client CA '" + config.client_ca_path + "': " + ec.message();
      return false;
    }
    context.set_verify_mode(ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
    if (ec) {
      error = "failed to enable client certificate verification: " + ec.message();
      return false;
    }
  }
  return true;
}

bool ConfigureClientTls(ssl::context& context, bool insecure, std::string& error) {
  boost::system::error_code ec;
  if (insecure) {
    context.set_verify_mode(ssl::verify_none, ec);
  } else {
    context.set_default_verify_paths(ec);
    if (!ec) {
      context.set_verify_mode(ssl::verify_peer, ec);
    }
  }
  if (ec) {
    error = "failed to configure TLS client: " + ec.message();
    return false;
  }
  return true;
}

} // namespace hwbridge::transport
