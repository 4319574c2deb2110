#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::core {

// Wire encodings accepted for binary device payloads (`encoding` param).
enum class PayloadEncoding {
  kUtf8,
  kBase64,
  kHex,
};

using Bytes = std::vector<std::uint8_t>;

bool ParsePayloadEncoding(std::string_view raw, PayloadEncoding& encoding, std::string& error);
std::string ToString(PayloadEncoding encoding);

// Decodes `text` into raw bytes. Malformed base64/hex fails with a message
// naming the encoding.
bool DecodePayload(std::string_view text, PayloadEncoding encoding, Bytes& bytes,
                   std::string& error);

// Encodes raw bytes for a JSON result. Invalid UTF-8 is not checked for
// kUtf8; callers that read arbitrary device bytes should prefer base64.
std::string EncodePayload(const Bytes& bytes, PayloadEncoding encoding);

} // namespace hwbridge::core
