#pragma once

#include "core/json_dom.hpp"
#include "devices/device_info.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace hwbridge::sessions {

enum class Parity {
  kNone,
  kOdd,
  kEven,
  kMark,
  kSpace,
};

enum class StopBits {
  kOne,
  kOnePointFive,
  kTwo,
};

enum class FlowControl {
  kNone,
  kXOnXOff,
  kRequestToSend,
  kRequestToSendXOnXOff,
};

struct SerialConfig {
  std::uint32_t baud_rate = 9600;
  Parity parity = Parity::kNone;
  std::uint8_t data_bits = 8;
  StopBits stop_bits = StopBits::kOne;
  FlowControl flow_control = FlowControl::kNone;
  std::chrono::milliseconds read_timeout{10000};
};

std::string ToString(Parity parity);
std::string ToString(StopBits stop_bits);
std::string ToString(FlowControl flow_control);

// Enum names match case-insensitively; stop bits also accept "One",
// "OnePointFive", "Two" and plain numbers.
bool ParseParity(std::string_view raw, Parity& parity);
bool ParseStopBits(std::string_view raw, StopBits& stop_bits);
bool ParseFlowControl(std::string_view raw, FlowControl& flow_control);

// Reads serial.open params on top of defaults; only types and enum spellings
// are checked here.
bool ParseSerialConfig(const core::json::Value& params, SerialConfig& config, std::string& error);

// Checks a parsed config against the port's declared capability ranges.
bool ValidateSerialConfig(const SerialConfig& config, const devices::SerialDetail& detail,
                          std::string& error);

core::json::Value ToJson(const SerialConfig& config);

} // namespace hwbridge::sessions
