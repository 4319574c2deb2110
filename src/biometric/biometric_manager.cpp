#include "biometric/biometric_manager.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <sstream>

namespace hwbridge::biometric {

namespace {

std::string FormatConfidence(double confidence) {
  std::ostringstream out;
  out.precision(3);
  out << confidence;
  return out.str();
}

} // namespace

double ComputeMatchConfidence(std::string_view enrolled, std::string_view presented) {
  const std::size_t longest = std::max(enrolled.size(), presented.size());
  if (longest == 0U) {
    return 0.0;
  }
  const std::size_t overlap = std::min(enrolled.size(), presented.size());
  std::size_t matches = 0;
  for (std::size_t i = 0; i < overlap; ++i) {
    if (enrolled[i] == presented[i]) {
      ++matches;
    }
  }
  return static_cast<double>(matches) / static_cast<double>(longest);
}

BiometricManager::BiometricManager(core::logging::Logger logger) : logger_(std::move(logger)) {}

bool BiometricManager::Enroll(const std::string& device_id, const std::string& user_id,
                              const std::string& user_name, const std::string& biometric_data,
                              bool& updated, std::string& error) {
  updated = false;
  if (biometric_data.empty()) {
    error = "Biometric data is required";
    return false;
  }
  if (user_id.empty()) {
    error = "userId is required";
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto& device_users = users_[device_id];
  const auto it = device_users.find(user_id);
  const auto now = std::chrono::system_clock::now();
  if (it != device_users.end()) {
    it->second.user_name = user_name;
    it->second.biometric_template = biometric_data;
    it->second.updated_at = now;
    updated = true;
    logger_.Info("biometric enrollment updated", {{"device_id", device_id}, {"user_id", user_id}});
    return true;
  }
  if (device_users.size() >= kMaxUsersPerDevice) {
    error = "Device " + device_id + " already holds the maximum of " +
            std::to_string(kMaxUsersPerDevice) + " users";
    return false;
  }

  device_users.emplace(user_id, EnrolledUser{
                                    .user_id = user_id,
                                    .user_name = user_name,
                                    .device_id = device_id,
                                    .biometric_template = biometric_data,
                                    .enrolled_at = now,
                                    .updated_at = std::nullopt,
                                });
  logger_.Info("biometric user enrolled", {{"device_id", device_id}, {"user_id", user_id}});
  return true;
}

bool BiometricManager::Authenticate(const std::string& device_id, const std::string& user_id,
                                    const std::string& biometric_data, VerifyResult& result,
                                    std::string& error) {
  result = {};
  std::lock_guard<std::mutex> lock(mutex_);
  const auto device_it = users_.find(device_id);
  if (device_it == users_.end() || device_it->second.empty()) {
    error = "No users enrolled on this device";
    return false;
  }
  const auto user_it = device_it->second.find(user_id);
  if (user_it == device_it->second.end()) {
    return true;
  }

  result.confidence = ComputeMatchConfidence(user_it->second.biometric_template, biometric_data);
  result.verified = result.confidence >= kMatchThreshold;
  logger_.Info("biometric verification",
               {{"device_id", device_id},
                {"user_id", user_id},
                {"verified", result.verified ? "true" : "false"},
                {"confidence", FormatConfidence(result.confidence)}});
  return true;
}

bool BiometricManager::Identify(const std::string& device_id, const std::string& biometric_data,
                                IdentifyResult& result, std::string& error) {
  result = {};
  if (biometric_data.empty()) {
    error = "Biometric data is required";
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto device_it = users_.find(device_id);
  if (device_it == users_.end() || device_it->second.empty()) {
    result.note = "No users enrolled on this device";
    return true;
  }

  const EnrolledUser* best = nullptr;
  for (const auto& [user_id, user] : device_it->second) {
    const double confidence = ComputeMatchConfidence(user.biometric_template, biometric_data);
    if (confidence > result.confidence) {
      result.confidence = confidence;
      best = &user;
    }
  }
  result.identified = best != nullptr && result.confidence >= kMatchThreshold;
  if (result.identified) {
    result.user_id = best->user_id;
    result.user_name = best->user_name;
  }
  logger_.Info("biometric identification",
               {{"device_id", device_id},
                {"identified", result.identified ? "true" : "false"},
                {"confidence", FormatConfidence(result.confidence)}});
  return true;
}

std::vector<EnrolledUser> BiometricManager::GetUsers(const std::string& device_id) const {
  std::vector<EnrolledUser> users;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto device_it = users_.find(device_id);
  if (device_it == users_.end()) {
    return users;
  }
  users.reserve(device_it->second.size());
  for (const auto& [user_id, user] : device_it->second) {
    EnrolledUser copy = user;
    copy.biometric_template.clear();
    users.push_back(std::move(copy));
  }
  return users;
}

bool BiometricManager::DeleteUser(const std::string& device_id, const std::string& user_id,
                                  std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto device_it = users_.find(device_id);
  if (device_it == users_.end() || device_it->second.empty()) {
    error = "No users enrolled on this device";
    return false;
  }
  if (device_it->second.erase(user_id) == 0U) {
    error = "User not found";
    return false;
  }
  logger_.Info("biometric user deleted", {{"device_id", device_id}, {"user_id", user_id}});
  return true;
}

std::size_t BiometricManager::UserCount(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto device_it = users_.find(device_id);
  return device_it == users_.end() ? 0U : device_it->second.size();
}

core::json::Value ToJson(const EnrolledUser& user) {
  core::json::Value out = core::json::MakeObject();
  out.Set("userId", core::json::MakeString(user.user_id));
  out.Set("userName", core::json::MakeString(user.user_name));
  out.Set("deviceId", core::json::MakeString(user.device_id));
  out.Set("enrolledAt", core::json::MakeString(core::FormatUtcTimestamp(user.enrolled_at)));
  if (user.updated_at.has_value()) {
    out.Set("updatedAt", core::json::MakeString(core::FormatUtcTimestamp(*user.updated_at)));
  }
  return out;
}

} // namespace hwbridge::biometric
