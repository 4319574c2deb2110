#pragma once

#include <cstdint>
#include <string_view>

namespace hwbridge::network {

// Advisory classification for an open TCP port. It labels discovery results
// and never gates any behavior.
struct PortClassification {
  std::uint16_t port = 0;
  std::string_view device_type;
  std::string_view protocol;
  std::string_view service;
};

inline constexpr PortClassification kWellKnownPorts[] = {
    {.port = 9100, .device_type = "printer", .protocol = "socket", .service = "RAW/JetDirect"},
    {.port = 631, .device_type = "printer", .protocol = "ipp", .service = "IPP"},
    {.port = 515, .device_type = "printer", .protocol = "lpd", .service = "LPD"},
    {.port = 4370, .device_type = "biometric", .protocol = "tcp", .service = "ZKTeco"},
};

inline PortClassification ClassifyPort(std::uint16_t port) {
  for (const auto& entry : kWellKnownPorts) {
    if (entry.port == port) {
      return entry;
    }
  }
  return {.port = port, .device_type = "network", .protocol = "tcp", .service = "unknown"};
}

} // namespace hwbridge::network
