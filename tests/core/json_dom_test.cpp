#include "core/json_dom.hpp"
#include "core/json_fields.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using hwbridge::core::json::Parse;
using hwbridge::core::json::Serialize;
using hwbridge::core::json::Value;

TEST_CASE("Parser accepts nested documents and keeps integers exact", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(Parse(R"({"id":7,"params":{"ports":[9100,631],"name":"a\u00e9b"},"ok":true,"x":null})",
                root, error));
  REQUIRE(root.IsObject());
  REQUIRE(root.Find("id")->number_value == 7.0);
  REQUIRE(root.Find("params")->Find("ports")->array_value.size() == 2U);
  REQUIRE(root.Find("params")->Find("name")->string_value == "a\xc3\xa9" "b");
  REQUIRE(root.Find("x")->IsNull());

  // Keys serialize in sorted order and integral numbers drop the fraction.
  REQUIRE(Serialize(root) ==
          R"({"id":7,"ok":true,"params":{"name":"a)" "\xc3\xa9" R"(b","ports":[9100,631]},"x":null})");
}

TEST_CASE("Parser reports malformed input", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(Parse("{\"a\":", root, error));
  REQUIRE_FALSE(error.empty());

  error.clear();
  REQUIRE_FALSE(Parse("{} trailing", root, error));
  REQUIRE(error.find("trailing") != std::string::npos);

  error.clear();
  REQUIRE_FALSE(Parse("[1,]", root, error));
}

TEST_CASE("Parser bounds nesting depth", "[core][json]") {
  std::string deep;
  for (int i = 0; i < 200; ++i) {
    deep += "[";
  }
  for (int i = 0; i < 200; ++i) {
    deep += "]";
  }
  Value root;
  std::string error;
  REQUIRE_FALSE(Parse(deep, root, error));
}

TEST_CASE("Serializer escapes control characters and quotes", "[core][json]") {
  Value value = hwbridge::core::json::MakeString("line\n\"quoted\"\t");
  REQUIRE(Serialize(value) == R"("line\n\"quoted\"\t")");
}

TEST_CASE("TryGetInteger rejects fractions and non-numbers", "[core][json]") {
  std::int64_t out = 0;
  REQUIRE(hwbridge::core::json::TryGetInteger(hwbridge::core::json::MakeNumber(42.0), out));
  REQUIRE(out == 42);
  REQUIRE_FALSE(hwbridge::core::json::TryGetInteger(hwbridge::core::json::MakeNumber(1.5), out));
  REQUIRE_FALSE(hwbridge::core::json::TryGetInteger(hwbridge::core::json::MakeString("3"), out));
}

TEST_CASE("ReadString distinguishes absent, required and ill-typed members", "[core][json]") {
  Value object;
  std::string error;
  REQUIRE(Parse(R"({"name":"printer","count":3})", object, error));

  std::string out = "default";
  REQUIRE(hwbridge::core::json::ReadString(object, "missing", out, false, error));
  REQUIRE(out == "default");

  REQUIRE_FALSE(hwbridge::core::json::ReadString(object, "missing", out, true, error));
  REQUIRE(error == "missing is required");

  REQUIRE_FALSE(hwbridge::core::json::ReadString(object, "count", out, false, error));
  REQUIRE(error == "count must be a string");

  REQUIRE(hwbridge::core::json::ReadString(object, "name", out, true, error));
  REQUIRE(out == "printer");
}
