#include "transport/origin_policy.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using hwbridge::transport::AdmitsAnyOrigin;
using hwbridge::transport::IsOriginAllowed;

TEST_CASE("Empty list and star admit every origin", "[transport][origin]") {
  REQUIRE(AdmitsAnyOrigin({}));
  REQUIRE(AdmitsAnyOrigin({"https://a.test", "*"}));
  REQUIRE_FALSE(AdmitsAnyOrigin({"https://a.test"}));

  REQUIRE(IsOriginAllowed({"*"}, "http://evil.test"));
  REQUIRE(IsOriginAllowed({}, ""));
}

TEST_CASE("Exact entries compare case-insensitively", "[transport][origin]") {
  const std::vector<std::string> allowed = {"https://pos.example.com"};
  REQUIRE(IsOriginAllowed(allowed, "https://POS.example.com"));
  REQUIRE_FALSE(IsOriginAllowed(allowed, "https://pos.example.com.evil.test"));
  REQUIRE_FALSE(IsOriginAllowed(allowed, "http://pos.example.com"));
}

TEST_CASE("Wildcard entries match subdomains only", "[transport][origin]") {
  const std::vector<std::string> allowed = {"*.example.com"};
  REQUIRE(IsOriginAllowed(allowed, "https://app.example.com"));
  REQUIRE(IsOriginAllowed(allowed, "http://deep.app.example.com:8080"));
  REQUIRE_FALSE(IsOriginAllowed(allowed, "https://example.com"));
  REQUIRE_FALSE(IsOriginAllowed(allowed, "https://badexample.com"));
}

TEST_CASE("Missing origin is refused when the list is restrictive", "[transport][origin]") {
  REQUIRE_FALSE(IsOriginAllowed({"https://pos.example.com"}, ""));
}
