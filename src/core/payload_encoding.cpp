#include "core/payload_encoding.hpp"

#include "core/string_utils.hpp"

#include <openssl/evp.h>

namespace hwbridge::core {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool DecodeBase64(std::string_view text, Bytes& bytes, std::string& error) {
  std::string compact;
  compact.reserve(text.size());
  for (const char c : text) {
    if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
      compact.push_back(c);
    }
  }
  if (compact.empty()) {
    bytes.clear();
    return true;
  }
  if (compact.size() % 4U != 0U) {
    error = "invalid base64 payload: length must be a multiple of 4";
    return false;
  }

  Bytes decoded(compact.size() / 4U * 3U);
  const int written =
      EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(compact.data()),
                      static_cast<int>(compact.size()));
  if (written < 0) {
    error = "invalid base64 payload";
    return false;
  }

  // EVP_DecodeBlock counts padding as zero bytes.
  std::size_t padding = 0;
  if (compact.back() == '=') {
    ++padding;
    if (compact[compact.size() - 2U] == '=') {
      ++padding;
    }
  }
  decoded.resize(static_cast<std::size_t>(written) - padding);
  bytes = std::move(decoded);
  return true;
}

bool DecodeHex(std::string_view text, Bytes& bytes, std::string& error) {
  std::string compact;
  compact.reserve(text.size());
  for (const char c : text) {
    if (c != ' ' && c != ':' && c != '-') {
      compact.push_back(c);
    }
  }
  if (compact.size() % 2U != 0U) {
    error = "invalid hex payload: odd number of digits";
    return false;
  }

  Bytes decoded;
  decoded.reserve(compact.size() / 2U);
  for (std::size_t i = 0; i < compact.size(); i += 2U) {
    const int high = HexNibble(compact[i]);
    const int low = HexNibble(compact[i + 1U]);
    if (high < 0 || low < 0) {
      error = "invalid hex payload: non-hex character";
      return false;
    }
    decoded.push_back(static_cast<std::uint8_t>((high << 4) | low));
  }
  bytes = std::move(decoded);
  return true;
}

} // namespace

bool ParsePayloadEncoding(std::string_view raw, PayloadEncoding& encoding, std::string& error) {
  const std::string normalized = ToLower(Trim(raw));
  if (normalized.empty() || normalized == "utf8" || normalized == "utf-8" ||
      normalized == "text" || normalized == "ascii") {
    encoding = PayloadEncoding::kUtf8;
    return true;
  }
  if (normalized == "base64") {
    encoding = PayloadEncoding::kBase64;
    return true;
  }
  if (normalized == "hex") {
    encoding = PayloadEncoding::kHex;
    return true;
  }
  error = "unsupported encoding '" + std::string(raw) + "' (expected utf8|base64|hex)";
  return false;
}

std::string ToString(PayloadEncoding encoding) {
  switch (encoding) {
  case PayloadEncoding::kUtf8:
    return "utf8";
  case PayloadEncoding::kBase64:
    return "base64";
  case PayloadEncoding::kHex:
    return "hex";
  }
  return "utf8";
}

bool DecodePayload(std::string_view text, PayloadEncoding encoding, Bytes& bytes,
                   std::string& error) {
  switch (encoding) {
  case PayloadEncoding::kUtf8:
    bytes.assign(text.begin(), text.end());
    return true;
  case PayloadEncoding::kBase64:
    return DecodeBase64(text, bytes, error);
  case PayloadEncoding::kHex:
    return DecodeHex(text, bytes, error);
  }
  error = "unsupported encoding";
  return false;
}

std::string EncodePayload(const Bytes& bytes, PayloadEncoding encoding) {
  switch (encoding) {
  case PayloadEncoding::kUtf8:
    return std::string(bytes.begin(), bytes.end());
  case PayloadEncoding::kBase64: {
    if (bytes.empty()) {
      return "";
    }
    std::string encoded(((bytes.size() + 2U) / 3U) * 4U + 1U, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                        bytes.data(), static_cast<int>(bytes.size()));
    encoded.resize(written < 0 ? 0U : static_cast<std::size_t>(written));
    return encoded;
  }
  case PayloadEncoding::kHex: {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string encoded;
    encoded.reserve(bytes.size() * 2U);
    for (const std::uint8_t byte : bytes) {
      encoded.push_back(kHex[(byte >> 4U) & 0x0FU]);
      encoded.push_back(kHex[byte & 0x0FU]);
    }
    return encoded;
  }
  }
  return "";
}

} // namespace hwbridge::core
