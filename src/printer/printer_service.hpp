#pragma once

#include "core/logging/logger.hpp"
#include "core/payload_encoding.hpp"
#include "devices/device_info.hpp"
#include "devices/device_registry.hpp"
#include "network/network_manager.hpp"
#include "printer/print_encoder.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace hwbridge::printer {

enum class PrintErrorKind {
  kNotFound,
  kNotPrinter,
  kValidation,
  kIo,
};

struct PrintError {
  PrintErrorKind kind = PrintErrorKind::kIo;
  std::string message;
};

struct PrinterProbe {
  // ready | offline | unknown
  std::string status = "unknown";
  bool is_online = false;
  std::string error;
};

// Stateless printer access. Printers never hold a session: every job is
// encoded and delivered in one shot, which is why print requests go through
// the job queue rather than straight to the device.
//
// Delivery routes, first match wins:
// - simulated printers accept and count the bytes
// - printers with a network detail get a one-shot TCP connection
// - printers with a device path get a write to that character device
class PrinterService {
public:
  PrinterService(devices::DeviceRegistry& registry, network::NetworkManager& network,
                 std::unique_ptr<IPrintEncoder> encoder, core::logging::Logger logger);

  bool ResolvePrinter(const std::string& device_id, devices::DeviceInfo& device,
                      PrintError& error);

  bool Print(const std::string& device_id, PrintFormat format, const core::Bytes& payload,
             std::size_t& bytes_printed, PrintError& error);

  bool Probe(const std::string& device_id, PrinterProbe& probe, PrintError& error);

  bool GetCapabilities(const std::string& device_id, devices::PrinterDetail& capabilities,
                       PrintError& error);

  std::uint64_t SimulatedBytesDelivered() const;

private:
  bool Deliver(const devices::DeviceInfo& device, const core::Bytes& data, PrintError& error);

  devices::DeviceRegistry& registry_;
  network::NetworkManager& network_;
  std::unique_ptr<IPrintEncoder> encoder_;
  core::logging::Logger logger_;
  std::atomic<std::uint64_t> simulated_bytes_{0};
};

} // namespace hwbridge::printer
