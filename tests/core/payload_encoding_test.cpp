#include "core/payload_encoding.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using hwbridge::core::Bytes;
using hwbridge::core::DecodePayload;
using hwbridge::core::EncodePayload;
using hwbridge::core::PayloadEncoding;

TEST_CASE("Encoding names parse case-insensitively with utf8 aliases", "[core][payload]") {
  PayloadEncoding encoding = PayloadEncoding::kHex;
  std::string error;
  REQUIRE(hwbridge::core::ParsePayloadEncoding("UTF-8", encoding, error));
  REQUIRE(encoding == PayloadEncoding::kUtf8);
  REQUIRE(hwbridge::core::ParsePayloadEncoding("Base64", encoding, error));
  REQUIRE(encoding == PayloadEncoding::kBase64);
  REQUIRE(hwbridge::core::ParsePayloadEncoding("hex", encoding, error));
  REQUIRE(encoding == PayloadEncoding::kHex);
  REQUIRE_FALSE(hwbridge::core::ParsePayloadEncoding("binary", encoding, error));
  REQUIRE(error.find("binary") != std::string::npos);
}

TEST_CASE("Base64 decoding strips padding and whitespace", "[core][payload]") {
  Bytes bytes;
  std::string error;
  REQUIRE(DecodePayload("SGVs\nbG8=", PayloadEncoding::kBase64, bytes, error));
  REQUIRE(std::string(bytes.begin(), bytes.end()) == "Hello");

  REQUIRE(DecodePayload("SGk=", PayloadEncoding::kBase64, bytes, error));
  REQUIRE(bytes.size() == 2U);

  REQUIRE_FALSE(DecodePayload("abc", PayloadEncoding::kBase64, bytes, error));
  REQUIRE(error.find("base64") != std::string::npos);
}

TEST_CASE("Hex decoding accepts separators and rejects bad digits", "[core][payload]") {
  Bytes bytes;
  std::string error;
  REQUIRE(DecodePayload("1b:40 0A", PayloadEncoding::kHex, bytes, error));
  REQUIRE(bytes == Bytes{0x1b, 0x40, 0x0a});
  REQUIRE(EncodePayload(bytes, PayloadEncoding::kHex) == "1b400a");

  REQUIRE_FALSE(DecodePayload("abc", PayloadEncoding::kHex, bytes, error));
  REQUIRE_FALSE(DecodePayload("zz", PayloadEncoding::kHex, bytes, error));
  REQUIRE(error.find("non-hex") != std::string::npos);
}

TEST_CASE("Base64 encoding matches the standard alphabet", "[core][payload]") {
  const std::string text = "hwbridge";
  REQUIRE(EncodePayload(Bytes(text.begin(), text.end()), PayloadEncoding::kBase64) ==
          "aHdicmlkZ2U=");
  REQUIRE(EncodePayload(Bytes{}, PayloadEncoding::kBase64).empty());
}
