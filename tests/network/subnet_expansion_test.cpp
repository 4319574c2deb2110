#include "network/discovery_scanner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using hwbridge::network::ExpandSubnet;

TEST_CASE("Three-octet prefixes expand to hosts 1 through 254", "[network][discovery]") {
  std::vector<std::string> hosts;
  std::string error;
  REQUIRE(ExpandSubnet("192.168.1", hosts, error));
  REQUIRE(hosts.size() == 254U);
  REQUIRE(hosts.front() == "192.168.1.1");
  REQUIRE(hosts.back() == "192.168.1.254");
}

TEST_CASE("Two-octet prefixes read like inet_aton", "[network][discovery]") {
  std::vector<std::string> hosts;
  std::string error;
  REQUIRE(ExpandSubnet("127.0", hosts, error));
  REQUIRE(hosts.size() == 254U);
  REQUIRE(hosts[0] == "127.0.0.1");
  REQUIRE(hosts[2] == "127.0.0.3");
}

TEST_CASE("CIDR blocks exclude network and broadcast addresses", "[network][discovery]") {
  std::vector<std::string> hosts;
  std::string error;
  REQUIRE(ExpandSubnet("10.0.0.77/30", hosts, error));
  REQUIRE(hosts.size() == 2U);
  REQUIRE(hosts[0] == "10.0.0.77");
  REQUIRE(hosts[1] == "10.0.0.78");

  REQUIRE(ExpandSubnet("10.1.0.0/24", hosts, error));
  REQUIRE(hosts.size() == 254U);
}

TEST_CASE("Malformed subnets are rejected", "[network][discovery]") {
  std::vector<std::string> hosts;
  std::string error;
  REQUIRE_FALSE(ExpandSubnet("", hosts, error));
  REQUIRE_FALSE(ExpandSubnet("300.1.1", hosts, error));
  REQUIRE_FALSE(ExpandSubnet("10.0.0.0/8", hosts, error));
  REQUIRE(error.find("between 16 and 30") != std::string::npos);
  REQUIRE_FALSE(ExpandSubnet("10.0/24", hosts, error));
  REQUIRE_FALSE(ExpandSubnet("a.b.c", hosts, error));
}

TEST_CASE("A single address expands to itself", "[network][discovery]") {
  std::vector<std::string> hosts;
  std::string error;
  REQUIRE(ExpandSubnet("127.0.0.2", hosts, error));
  REQUIRE(hosts == std::vector<std::string>{"127.0.0.2"});
}
