#include "printer/printer_service.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace hwbridge::printer {

namespace {

bool WriteToDevicePath(const std::string& path, const core::Bytes& data, std::string& error) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    error = "failed to open printer " + path + ": " + std::strerror(errno);
    return false;
  }
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      error = "failed to write to printer " + path + ": " + std::strerror(errno);
      ::close(fd);
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  if (::close(fd) != 0) {
    error = "failed to flush printer " + path + ": " + std::strerror(errno);
    return false;
  }
  return true;
}

} // namespace

PrinterService::PrinterService(devices::DeviceRegistry& registry,
                               network::NetworkManager& network,
                               std::unique_ptr<IPrintEncoder> encoder,
                               core::logging::Logger logger)
    : registry_(registry),
      network_(network),
      encoder_(std::move(encoder)),
      logger_(std::move(logger)) {}

bool PrinterService::ResolvePrinter(const std::string& device_id, devices::DeviceInfo& device,
                                    PrintError& error) {
  std::string lookup_error;
  if (!registry_.Get(device_id, device, lookup_error)) {
    error = {PrintErrorKind::kNotFound, lookup_error};
    return false;
  }
  if (device.FindDetail<devices::PrinterDetail>() == nullptr) {
    error = {PrintErrorKind::kNotPrinter, "Device " + device_id + " is not a printer"};
    return false;
  }
  return true;
}

bool PrinterService::Print(const std::string& device_id, PrintFormat format,
                           const core::Bytes& payload, std::size_t& bytes_printed,
                           PrintError& error) {
  bytes_printed = 0;
  devices::DeviceInfo device;
  if (!ResolvePrinter(device_id, device, error)) {
    return false;
  }

  core::Bytes encoded;
  std::string encode_error;
  if (!encoder_->Encode(device, format, payload, encoded, encode_error)) {
    error = {PrintErrorKind::kValidation, encode_error};
    return false;
  }
  if (!Deliver(device, encoded, error)) {
    logger_.Warn("print delivery failed", {{"device_id", device_id}, {"error", error.message}});
    return false;
  }

  bytes_printed = encoded.size();
  logger_.Info("print job delivered", {{"device_id", device_id},
                                       {"format", ToString(format)},
                                       {"bytes", std::to_string(bytes_printed)}});
  return true;
}

bool PrinterService::Deliver(const devices::DeviceInfo& device, const core::Bytes& data,
                             PrintError& error) {
  if (device.simulated) {
    simulated_bytes_ += data.size();
    return true;
  }
  std::string io_error;
  if (const auto* endpoint = device.FindDetail<devices::NetworkDetail>()) {
    if (!network_.SendOnce(endpoint->host, endpoint->port, data, io_error)) {
      error = {PrintErrorKind::kIo, io_error};
      return false;
    }
    return true;
  }
  const auto* detail = device.FindDetail<devices::PrinterDetail>();
  if (detail != nullptr && !detail->device_path.empty()) {
    if (!WriteToDevicePath(detail->device_path, data, io_error)) {
      error = {PrintErrorKind::kIo, io_error};
      return false;
    }
    return true;
  }
  error = {PrintErrorKind::kIo, "Printer " + device.id + " has no delivery route"};
  return false;
}

bool PrinterService::Probe(const std::string& device_id, PrinterProbe& probe,
                           PrintError& error) {
  probe = {};
  devices::DeviceInfo device;
  if (!ResolvePrinter(device_id, device, error)) {
    return false;
  }

  if (device.simulated) {
    probe.status = "ready";
    probe.is_online = true;
    return true;
  }
  if (const auto* endpoint = device.FindDetail<devices::NetworkDetail>()) {
    const network::PingResult ping = network_.Ping(device_id, endpoint->host, endpoint->port);
    probe.is_online = ping.is_online;
    probe.status = ping.is_online ? "ready" : "offline";
    probe.error = ping.error;
    return true;
  }
  const auto* detail = device.FindDetail<devices::PrinterDetail>();
  if (detail != nullptr && !detail->device_path.empty()) {
    probe.is_online = ::access(detail->device_path.c_str(), W_OK) == 0;
    probe.status = probe.is_online ? "ready" : "offline";
    if (!probe.is_online) {
      probe.error = std::strerror(errno);
    }
  }
  return true;
}

bool PrinterService::GetCapabilities(const std::string& device_id,
                                     devices::PrinterDetail& capabilities, PrintError& error) {
  devices::DeviceInfo device;
  if (!ResolvePrinter(device_id, device, error)) {
    return false;
  }
  capabilities = *device.FindDetail<devices::PrinterDetail>();
  return true;
}

std::uint64_t PrinterService::SimulatedBytesDelivered() const {
  return simulated_bytes_.load();
}

} // namespace hwbridge::printer
