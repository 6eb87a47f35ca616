#include <catch2/catch_all.hpp>

#include <unordered_set>
#include <vector>

#include <errata/classification.hpp>
#include <tests/support/sample_kinds.hpp>

using errata::classification;
using errata::classification_set;
using errata::core::error_code;

TEST_CASE("classification equality is by stable identifier", "[classification]") {
  // Two independently constructed values with the same token compare equal,
  // which is what a peer process sees after decoding.
  std::string storage = "not_found";
  classification local{storage};
  REQUIRE(local == test_support::not_found);
  REQUIRE(test_support::not_found != test_support::io_error);
  REQUIRE(test_support::io_error < test_support::not_found);
}

TEST_CASE("classification is hashable", "[classification]") {
  std::unordered_set<classification> seen{test_support::not_found, test_support::io_error};
  REQUIRE(seen.count(test_support::not_found) == 1);
  REQUIRE(seen.count(test_support::permission_denied) == 0);
}

TEST_CASE("default classification is the unrecognized sentinel", "[classification]") {
  classification k{};
  REQUIRE(k == classification::unrecognized());
  REQUIRE_FALSE(k.recognized());
  REQUIRE(k.id() == classification::unrecognized_id);
  REQUIRE(test_support::not_found.recognized());
}

TEST_CASE("classification_set lookup", "[classification][set]") {
  auto set = test_support::sample_set();
  REQUIRE(set.size() == 4);
  auto hit = set.find("io_error");
  REQUIRE(hit.has_value());
  REQUIRE(*hit == test_support::io_error);
  REQUIRE_FALSE(set.find("quota_exceeded").has_value());
  REQUIRE(set.contains(test_support::config_load_failed));
  REQUIRE_FALSE(set.contains(test_support::quota_exceeded));
}

TEST_CASE("classification_set iterates in declaration order", "[classification][set]") {
  auto set = test_support::sample_set();
  std::vector<classification> order(set.begin(), set.end());
  REQUIRE(order == std::vector<classification>{test_support::not_found, test_support::io_error,
                                               test_support::config_load_failed,
                                               test_support::permission_denied});
}

TEST_CASE("classification_set rejects invalid identifiers", "[classification][set]") {
  SECTION("duplicate") {
    auto set = classification_set::make({test_support::not_found, classification{"not_found"}});
    REQUIRE_FALSE(set.has_value());
    REQUIRE(set.error().code == error_code::invalid_argument);
    REQUIRE(set.error().component == "classification.set");
  }
  SECTION("empty") {
    auto set = classification_set::make({classification{""}});
    REQUIRE_FALSE(set.has_value());
  }
  SECTION("whitespace") {
    auto set = classification_set::make({classification{"not found"}});
    REQUIRE_FALSE(set.has_value());
  }
  SECTION("reserved sentinel") {
    auto set = classification_set::make({classification::unrecognized()});
    REQUIRE_FALSE(set.has_value());
    REQUIRE(set.error().code == error_code::invalid_argument);
  }
}

TEST_CASE("empty classification_set is valid", "[classification][set]") {
  auto set = classification_set::make({});
  REQUIRE(set.has_value());
  REQUIRE(set->empty());
  REQUIRE_FALSE(set->find("not_found").has_value());
}

TEST_CASE("empty identifier constructs the sentinel", "[classification]") {
  constexpr classification blank{""};
  STATIC_REQUIRE(blank == classification::unrecognized());
  REQUIRE_FALSE(blank.recognized());
  REQUIRE_FALSE(blank.id().empty());
}

TEST_CASE("identifier validity", "[classification]") {
  STATIC_REQUIRE(classification::is_valid_id("config.load_failed"));
  STATIC_REQUIRE_FALSE(classification::is_valid_id(""));
  STATIC_REQUIRE_FALSE(classification::is_valid_id("  "));
  STATIC_REQUIRE_FALSE(classification::is_valid_id("tab\there"));
  REQUIRE_FALSE(classification::is_valid_id("caf\xC3\xA9"));
}
