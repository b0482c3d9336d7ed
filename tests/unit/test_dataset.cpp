//==============================================================================
// Test: Dataset
//
// Unit tests for the attribute map and time-aligned variable container.
//==============================================================================

#include "dataset.hpp"
#include <catch2/catch.hpp>

#include <stdexcept>

using namespace obsnc;

TEST_CASE("AttributeMap", "[unit][dataset]") {
  AttributeMap attrs;

  SECTION("keeps insertion order and overwrites in place") {
    attrs.set("title", std::string("a"));
    attrs.set("count", std::int32_t{3});
    attrs.set("title", std::string("b"));

    REQUIRE(attrs.size() == 2);
    REQUIRE(attrs.begin()->first == "title");
    REQUIRE(attrs.get_string("title") == "b");
    REQUIRE(std::get<std::int32_t>(attrs.get("count")) == 3);
  }

  SECTION("missing and non-text lookups") {
    attrs.set("value", 1.5);
    REQUIRE_FALSE(attrs.has("nothing"));
    REQUIRE(attrs.get_string("nothing").empty());
    REQUIRE(attrs.get_string("value").empty());
    REQUIRE_THROWS_AS(attrs.get("nothing"), std::out_of_range);
  }

  SECTION("erase") {
    attrs.set("a", std::string("x"));
    attrs.erase("a");
    attrs.erase("a");
    REQUIRE(attrs.empty());
  }

  SECTION("attribute values render as text") {
    REQUIRE(attr_to_string(AttrValue{std::string("abc")}) == "abc");
    REQUIRE(attr_to_string(AttrValue{std::int64_t{1700000000}}) ==
            "1700000000");
    REQUIRE(attr_to_string(AttrValue{34.5}) == "34.5");
  }
}

TEST_CASE("Dataset variables", "[unit][dataset]") {
  Dataset ds;
  ds.set_time({10, 20, 30});

  SECTION("variables align with the time coordinate") {
    auto &v = ds.add_variable("latitude", std::vector<double>{1.0, 2.0, 3.0});
    REQUIRE(v.size() == 3);
    REQUIRE(ds.size() == 3);
    REQUIRE(ds.has_variable("latitude"));
    REQUIRE(ds.has_variable("time"));
    REQUIRE(&ds.variable("time") == &ds.time());
    REQUIRE(ds.time_values() == std::vector<std::int64_t>{10, 20, 30});
  }

  SECTION("length mismatch is rejected") {
    REQUIRE_THROWS_AS(
        ds.add_variable("latitude", std::vector<double>{1.0, 2.0}),
        std::invalid_argument);
  }

  SECTION("duplicate names are rejected") {
    ds.add_variable("x", std::vector<std::int32_t>{1, 2, 3});
    REQUIRE_THROWS_AS(ds.add_variable("x", std::vector<std::int32_t>{1, 2, 3}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(
        ds.add_variable("time", std::vector<std::int64_t>{1, 2, 3}),
        std::invalid_argument);
  }

  SECTION("time cannot be reset after variables exist") {
    ds.add_variable("x", std::vector<double>{1.0, 2.0, 3.0});
    REQUIRE_THROWS_AS(ds.set_time({1}), std::invalid_argument);
  }

  SECTION("unknown variable") {
    REQUIRE_FALSE(ds.has_variable("salinity"));
    REQUIRE_THROWS_AS(ds.variable("salinity"), std::out_of_range);
  }
}
