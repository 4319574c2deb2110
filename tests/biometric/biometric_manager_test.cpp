#include "biometric/biometric_manager.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using hwbridge::biometric::BiometricManager;
using hwbridge::biometric::ComputeMatchConfidence;

namespace {

hwbridge::core::logging::Logger QuietLogger() {
  static std::ostringstream sink;
  return hwbridge::core::logging::Logger(hwbridge::core::logging::LogLevel::kError, sink);
}

} // namespace

TEST_CASE("Match confidence is positional similarity over the longer template",
          "[biometric]") {
  REQUIRE(ComputeMatchConfidence("abcd", "abcd") == Catch::Approx(1.0));
  REQUIRE(ComputeMatchConfidence("abcd", "abcx") == Catch::Approx(0.75));
  REQUIRE(ComputeMatchConfidence("abcd", "ab") == Catch::Approx(0.5));
  REQUIRE(ComputeMatchConfidence("", "") == Catch::Approx(0.0));
}

TEST_CASE("Enroll then verify against the 0.7 threshold", "[biometric]") {
  BiometricManager manager(QuietLogger());
  bool updated = true;
  std::string error;
  REQUIRE(manager.Enroll("bio-1", "u1", "Alice", "0123456789", updated, error));
  REQUIRE_FALSE(updated);

  hwbridge::biometric::VerifyResult verify;
  REQUIRE(manager.Authenticate("bio-1", "u1", "0123456xxx", verify, error));
  REQUIRE(verify.verified);
  REQUIRE(verify.confidence == Catch::Approx(0.7));

  REQUIRE(manager.Authenticate("bio-1", "u1", "01234xxxxx", verify, error));
  REQUIRE_FALSE(verify.verified);

  // Unknown users are a negative result rather than an error.
  REQUIRE(manager.Authenticate("bio-1", "ghost", "0123456789", verify, error));
  REQUIRE_FALSE(verify.verified);
  REQUIRE(verify.confidence == 0.0);

  REQUIRE(manager.Enroll("bio-1", "u1", "Alice B", "abcdefghij", updated, error));
  REQUIRE(updated);
  REQUIRE(manager.UserCount("bio-1") == 1U);
}

TEST_CASE("Authenticating on an empty device fails", "[biometric]") {
  BiometricManager manager(QuietLogger());
  hwbridge::biometric::VerifyResult verify;
  std::string error;
  REQUIRE_FALSE(manager.Authenticate("bio-empty", "u1", "data", verify, error));
  REQUIRE(error == "No users enrolled on this device");
}

TEST_CASE("Identify picks the best match and reports empty devices", "[biometric]") {
  BiometricManager manager(QuietLogger());
  hwbridge::biometric::IdentifyResult result;
  std::string error;
  REQUIRE(manager.Identify("bio-1", "anything", result, error));
  REQUIRE_FALSE(result.identified);
  REQUIRE(result.note == "No users enrolled on this device");

  bool updated = false;
  REQUIRE(manager.Enroll("bio-1", "u1", "Alice", "aaaaaaaaaa", updated, error));
  REQUIRE(manager.Enroll("bio-1", "u2", "Bob", "bbbbbbbbbb", updated, error));

  REQUIRE(manager.Identify("bio-1", "bbbbbbbbba", result, error));
  REQUIRE(result.identified);
  REQUIRE(result.user_id == "u2");
  REQUIRE(result.user_name == "Bob");
  REQUIRE(result.confidence == Catch::Approx(0.9));
}

TEST_CASE("GetUsers hides templates and DeleteUser removes records", "[biometric]") {
  BiometricManager manager(QuietLogger());
  bool updated = false;
  std::string error;
  REQUIRE(manager.Enroll("bio-1", "u1", "Alice", "secret-template", updated, error));

  const auto users = manager.GetUsers("bio-1");
  REQUIRE(users.size() == 1U);
  REQUIRE(users.front().biometric_template.empty());
  REQUIRE(users.front().user_name == "Alice");

  REQUIRE_FALSE(manager.DeleteUser("bio-1", "ghost", error));
  REQUIRE(error == "User not found");
  REQUIRE(manager.DeleteUser("bio-1", "u1", error));
  REQUIRE(manager.UserCount("bio-1") == 0U);
}
