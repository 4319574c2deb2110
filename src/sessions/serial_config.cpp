#include "sessions/serial_config.hpp"

#include "core/json_fields.hpp"
#include "core/string_utils.hpp"

#include <algorithm>

namespace hwbridge::sessions {

std::string ToString(Parity parity) {
  switch (parity) {
  case Parity::kNone:
    return "None";
  case Parity::kOdd:
    return "Odd";
  case Parity::kEven:
    return "Even";
  case Parity::kMark:
    return "Mark";
  case Parity::kSpace:
    return "Space";
  }
  return "None";
}

std::string ToString(StopBits stop_bits) {
  switch (stop_bits) {
  case StopBits::kOne:
    return "1";
  case StopBits::kOnePointFive:
    return "1.5";
  case StopBits::kTwo:
    return "2";
  }
  return "1";
}

std::string ToString(FlowControl flow_control) {
  switch (flow_control) {
  case FlowControl::kNone:
    return "None";
  case FlowControl::kXOnXOff:
    return "XOnXOff";
  case FlowControl::kRequestToSend:
    return "RequestToSend";
  case FlowControl::kRequestToSendXOnXOff:
    return "RequestToSendXOnXOff";
  }
  return "None";
}

bool ParseParity(std::string_view raw, Parity& parity) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  if (normalized == "none") {
    parity = Parity::kNone;
  } else if (normalized == "odd") {
    parity = Parity::kOdd;
  } else if (normalized == "even") {
    parity = Parity::kEven;
  } else if (normalized == "mark") {
    parity = Parity::kMark;
  } else if (normalized == "space") {
    parity = Parity::kSpace;
  } else {
    return false;
  }
  return true;
}

bool ParseStopBits(std::string_view raw, StopBits& stop_bits) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  if (normalized == "1" || normalized == "one") {
    stop_bits = StopBits::kOne;
  } else if (normalized == "1.5" || normalized == "onepointfive") {
    stop_bits = StopBits::kOnePointFive;
  } else if (normalized == "2" || normalized == "two") {
    stop_bits = StopBits::kTwo;
  } else {
    return false;
  }
  return true;
}

bool ParseFlowControl(std::string_view raw, FlowControl& flow_control) {
  const std::string normalized = core::ToLower(core::Trim(raw));
  if (normalized == "none") {
    flow_control = FlowControl::kNone;
  } else if (normalized == "xonxoff") {
    flow_control = FlowControl::kXOnXOff;
  } else if (normalized == "requesttosend") {
    flow_control = FlowControl::kRequestToSend;
  } else if (normalized == "requesttosendxonxoff") {
    flow_control = FlowControl::kRequestToSendXOnXOff;
  } else {
    return false;
  }
  return true;
}

bool ParseSerialConfig(const core::json::Value& params, SerialConfig& config, std::string& error) {
  std::int64_t baud_rate = config.baud_rate;
  if (!core::json::ReadInteger(params, "baudRate", baud_rate, false, error)) {
    return false;
  }
  if (baud_rate <= 0 || baud_rate > 4'000'000) {
    error = "baudRate must be a positive integer";
    return false;
  }
  config.baud_rate = static_cast<std::uint32_t>(baud_rate);

  std::int64_t data_bits = config.data_bits;
  if (!core::json::ReadInteger(params, "dataBits", data_bits, false, error)) {
    return false;
  }
  if (data_bits < 5 || data_bits > 8) {
    error = "dataBits must be between 5 and 8";
    return false;
  }
  config.data_bits = static_cast<std::uint8_t>(data_bits);

  std::string parity = ToString(config.parity);
  if (!core::json::ReadString(params, "parity", parity, false, error)) {
    return false;
  }
  if (!ParseParity(parity, config.parity)) {
    error = "parity must be one of None|Odd|Even|Mark|Space";
    return false;
  }

  const core::json::Value* stop_bits = params.Find("stopBits");
  if (!core::json::IsAbsent(stop_bits)) {
    std::string stop_text;
    if (stop_bits->IsString()) {
      stop_text = stop_bits->string_value;
    } else if (stop_bits->IsNumber()) {
      if (stop_bits->number_value == 1.0) {
        stop_text = "1";
      } else if (stop_bits->number_value == 1.5) {
        stop_text = "1.5";
      } else if (stop_bits->number_value == 2.0) {
        stop_text = "2";
      }
    }
    if (!ParseStopBits(stop_text, config.stop_bits)) {
      error = "stopBits must be one of 1|1.5|2";
      return false;
    }
  }

  std::string flow = ToString(config.flow_control);
  if (!core::json::ReadString(params, "flowControl", flow, false, error)) {
    return false;
  }
  if (!ParseFlowControl(flow, config.flow_control)) {
    error = "flowControl must be one of None|XOnXOff|RequestToSend|RequestToSendXOnXOff";
    return false;
  }

  std::int64_t read_timeout = config.read_timeout.count();
  if (!core::json::ReadBoundedInteger(params, "readTimeout", 0, 600'000, read_timeout, false,
                                      error)) {
    return false;
  }
  config.read_timeout = std::chrono::milliseconds(read_timeout);
  return true;
}

bool ValidateSerialConfig(const SerialConfig& config, const devices::SerialDetail& detail,
                          std::string& error) {
  const auto& rates = detail.supported_baud_rates;
  if (std::find(rates.begin(), rates.end(), config.baud_rate) == rates.end()) {
    std::string allowed;
    for (const auto rate : rates) {
      allowed += (allowed.empty() ? "" : ", ") + std::to_string(rate);
    }
    error = "Unsupported baud rate " + std::to_string(config.baud_rate) + " (supported: " +
            allowed + ")";
    return false;
  }
  if (config.data_bits != 7U && config.data_bits != 8U) {
    error = "Unsupported data bits " + std::to_string(config.data_bits) + " (supported: 7, 8)";
    return false;
  }
  return true;
}

core::json::Value ToJson(const SerialConfig& config) {
  core::json::Value out = core::json::MakeObject();
  out.Set("baudRate", core::json::MakeNumber(config.baud_rate));
  out.Set("parity", core::json::MakeString(ToString(config.parity)));
  out.Set("dataBits", core::json::MakeNumber(config.data_bits));
  out.Set("stopBits", core::json::MakeString(ToString(config.stop_bits)));
  out.Set("flowControl", core::json::MakeString(ToString(config.flow_control)));
  out.Set("readTimeout",
          core::json::MakeNumber(static_cast<double>(config.read_timeout.count())));
  return out;
}

} // namespace hwbridge::sessions
