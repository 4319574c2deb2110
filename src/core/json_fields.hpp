#ifndef HWBRIDGE_CORE_JSON_FIELDS_HPP_
#define HWBRIDGE_CORE_JSON_FIELDS_HPP_

#include "core/json_dom.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::core::json {

// Typed member readers used by config loading and RPC request parsing.
//
// Contract shared by every reader:
// - absent (or explicit null) members leave `out` untouched and succeed unless
//   `required` is set
// - a present member of the wrong type fails with "<key> must be <kind>"

inline bool IsAbsent(const Value* member) {
  return member == nullptr || member->IsNull();
}

inline bool ReadString(const Value& object, std::string_view key, std::string& out,
                       bool required, std::string& error) {
  const Value* member = object.Find(key);
  if (IsAbsent(member)) {
    if (required) {
      error = std::string(key) + " is required";
      return false;
    }
    return true;
  }
  if (!member->IsString()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = member->string_value;
  return true;
}

inline bool ReadOptionalString(const Value& object, std::string_view key,
                               std::optional<std::string>& out, std::string& error) {
  const Value* member = object.Find(key);
  if (IsAbsent(member)) {
    return true;
  }
  if (!member->IsString()) {
    error = std::string(key) + " must be a string";
    return false;
  }
  out = member->string_value;
  return true;
}

inline bool ReadBool(const Value& object, std::string_view key, bool& out, std::string& error) {
  const Value* member = object.Find(key);
  if (IsAbsent(member)) {
    return true;
  }
  if (!member->IsBool()) {
    error = std::string(key) + " must be a boolean";
    return false;
  }
  out = member->bool_value;
  return true;
}

inline bool TryGetInteger(const Value& value, std::int64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value)) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
      floored > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return false;
  }
  out = static_cast<std::int64_t>(floored);
  return true;
}

inline bool ReadInteger(const Value& object, std::string_view key, std::int64_t& out,
                        bool required, std::string& error) {
  const Value* member = object.Find(key);
  if (IsAbsent(member)) {
    if (required) {
      error = std::string(key) + " is required";
      return false;
    }
    return true;
  }
  if (!TryGetInteger(*member, out)) {
    error = std::string(key) + " must be an integer";
    return false;
  }
  return true;
}

// Reads an integer and enforces an inclusive range.
inline bool ReadBoundedInteger(const Value& object, std::string_view key, std::int64_t min_value,
                               std::int64_t max_value, std::int64_t& out, bool required,
                               std::string& error) {
  std::int64_t parsed = out;
  if (!ReadInteger(object, key, parsed, required, error)) {
    return false;
  }
  if (parsed < min_value || parsed > max_value) {
    error = std::string(key) + " must be between " + std::to_string(min_value) + " and " +
            std::to_string(max_value);
    return false;
  }
  out = parsed;
  return true;
}

inline bool ReadStringArray(const Value& object, std::string_view key,
                            std::vector<std::string>& out, std::string& error) {
  const Value* member = object.Find(key);
  if (IsAbsent(member)) {
    return true;
  }
  if (!member->IsArray()) {
    error = std::string(key) + " must be an array of strings";
    return false;
  }
  std::vector<std::string> parsed;
  parsed.reserve(member->array_value.size());
  for (const auto& item : member->array_value) {
    if (!item.IsString()) {
      error = std::string(key) + " must be an array of strings";
      return false;
    }
    parsed.push_back(item.string_value);
  }
  out = std::move(parsed);
  return true;
}

inline bool ReadPortArray(const Value& object, std::string_view key,
                          std::vector<std::uint16_t>& out, std::string& error) {
  const Value* member = object.Find(key);
  if (IsAbsent(member)) {
    return true;
  }
  if (!member->IsArray()) {
    error = std::string(key) + " must be an array of port numbers";
    return false;
  }
  std::vector<std::uint16_t> parsed;
  for (const auto& item : member->array_value) {
    std::int64_t port = 0;
    if (!TryGetInteger(item, port) || port < 1 || port > 65535) {
      error = std::string(key) + " entries must be integers between 1 and 65535";
      return false;
    }
    parsed.push_back(static_cast<std::uint16_t>(port));
  }
  out = std::move(parsed);
  return true;
}

} // namespace hwbridge::core::json

#endif // HWBRIDGE_CORE_JSON_FIELDS_HPP_
