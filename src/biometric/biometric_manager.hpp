#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::biometric {

constexpr double kMatchThreshold = 0.7;
constexpr std::size_t kMaxUsersPerDevice = 1000;

struct EnrolledUser {
  std::string user_id;
  std::string user_name;
  std::string device_id;
  std::string biometric_template;
  std::chrono::system_clock::time_point enrolled_at{};
  std::optional<std::chrono::system_clock::time_point> updated_at;
};

struct VerifyResult {
  bool verified = false;
  double confidence = 0.0;
};

struct IdentifyResult {
  bool identified = false;
  double confidence = 0.0;
  std::string user_id;
  std::string user_name;
  // Set when the device has nobody enrolled.
  std::string note;
};

// Fraction of positions holding the same character, over the longer input.
// Two empty templates score 0.
double ComputeMatchConfidence(std::string_view enrolled, std::string_view presented);

// In-memory per-device user tables for biometric readers. Templates are kept
// as the opaque strings clients send; nothing is persisted.
class BiometricManager {
public:
  explicit BiometricManager(core::logging::Logger logger);

  // Upserts. `updated` reports whether the user already existed.
  bool Enroll(const std::string& device_id, const std::string& user_id,
              const std::string& user_name, const std::string& biometric_data, bool& updated,
              std::string& error);

  // Unknown users verify false with zero confidence; a device without any
  // enrollment is an error.
  bool Authenticate(const std::string& device_id, const std::string& user_id,
                    const std::string& biometric_data, VerifyResult& result, std::string& error);

  bool Identify(const std::string& device_id, const std::string& biometric_data,
                IdentifyResult& result, std::string& error);

  // Template-free copies.
  std::vector<EnrolledUser> GetUsers(const std::string& device_id) const;
  bool DeleteUser(const std::string& device_id, const std::string& user_id, std::string& error);
  std::size_t UserCount(const std::string& device_id) const;

private:
  core::logging::Logger logger_;
  mutable std::mutex mutex_;
  // device id -> user id -> record.
  std::map<std::string, std::map<std::string, EnrolledUser>> users_;
};

core::json::Value ToJson(const EnrolledUser& user);

} // namespace hwbridge::biometric
