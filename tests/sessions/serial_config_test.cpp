#include "core/json_dom.hpp"
#include "sessions/serial_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using hwbridge::sessions::FlowControl;
using hwbridge::sessions::Parity;
using hwbridge::sessions::SerialConfig;
using hwbridge::sessions::StopBits;

namespace {

hwbridge::core::json::Value ParseParams(const std::string& text) {
  hwbridge::core::json::Value value;
  std::string error;
  REQUIRE(hwbridge::core::json::Parse(text, value, error));
  return value;
}

} // namespace

TEST_CASE("Absent members keep 9600 8N1 defaults", "[sessions][serial]") {
  SerialConfig config;
  std::string error;
  REQUIRE(hwbridge::sessions::ParseSerialConfig(ParseParams("{}"), config, error));
  REQUIRE(config.baud_rate == 9600U);
  REQUIRE(config.data_bits == 8U);
  REQUIRE(config.parity == Parity::kNone);
  REQUIRE(config.stop_bits == StopBits::kOne);
  REQUIRE(config.flow_control == FlowControl::kNone);
}

TEST_CASE("Enum spellings are case-insensitive and stop bits accept numbers",
          "[sessions][serial]") {
  SerialConfig config;
  std::string error;
  REQUIRE(hwbridge::sessions::ParseSerialConfig(
      ParseParams(R"({"baudRate":115200,"parity":"even","stopBits":1.5,"flowControl":"xonxoff"})"),
      config, error));
  REQUIRE(config.baud_rate == 115200U);
  REQUIRE(config.parity == Parity::kEven);
  REQUIRE(config.stop_bits == StopBits::kOnePointFive);
  REQUIRE(config.flow_control == FlowControl::kXOnXOff);

  REQUIRE(hwbridge::sessions::ParseSerialConfig(ParseParams(R"({"stopBits":"Two"})"), config,
                                                error));
  REQUIRE(config.stop_bits == StopBits::kTwo);
}

TEST_CASE("Unknown spellings fail with the accepted list", "[sessions][serial]") {
  SerialConfig config;
  std::string error;
  REQUIRE_FALSE(
      hwbridge::sessions::ParseSerialConfig(ParseParams(R"({"parity":"sideways"})"), config, error));
  REQUIRE(error.find("None|Odd|Even|Mark|Space") != std::string::npos);

  REQUIRE_FALSE(
      hwbridge::sessions::ParseSerialConfig(ParseParams(R"({"stopBits":3})"), config, error));
  REQUIRE_FALSE(
      hwbridge::sessions::ParseSerialConfig(ParseParams(R"({"baudRate":"fast"})"), config, error));
}

TEST_CASE("Validation checks the port's declared capabilities", "[sessions][serial]") {
  hwbridge::devices::SerialDetail detail;
  SerialConfig config;
  std::string error;
  REQUIRE(hwbridge::sessions::ValidateSerialConfig(config, detail, error));

  config.baud_rate = 12345;
  REQUIRE_FALSE(hwbridge::sessions::ValidateSerialConfig(config, detail, error));
  REQUIRE(error.find("Unsupported baud rate 12345") != std::string::npos);

  config.baud_rate = 9600;
  config.data_bits = 6;
  REQUIRE_FALSE(hwbridge::sessions::ValidateSerialConfig(config, detail, error));
  REQUIRE(error.find("data bits") != std::string::npos);
}
