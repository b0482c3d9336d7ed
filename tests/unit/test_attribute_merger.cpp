//==============================================================================
// Test: AttributeMerger
//
// Unit tests for merging configured global attributes.
//==============================================================================

#include "metadata/attribute_merger.hpp"
#include <catch2/catch.hpp>

using namespace obsnc;

TEST_CASE("AttributeMerger", "[unit][merger]") {
  Dataset ds;
  ds.attrs().set("title", std::string("station_a"));
  ds.attrs().set("geospatial_lat_min", 34.5);

  SECTION("new attributes are added in order") {
    GlobalAttributes attrs = {
        {"institution", AttrValue{std::string("Example Institute")}},
        {"platform_code", AttrValue{std::int64_t{61001}}}};
    REQUIRE(AttributeMerger().merge(ds, attrs) == 2);
    REQUIRE(ds.attrs().get_string("institution") == "Example Institute");
    REQUIRE(std::get<std::int64_t>(ds.attrs().get("platform_code")) == 61001);
  }

  SECTION("configured value overrides a computed one") {
    GlobalAttributes attrs = {{"title", AttrValue{std::string("Buoy 42")}}};
    AttributeMerger().merge(ds, attrs);
    REQUIRE(ds.attrs().get_string("title") == "Buoy 42");
    REQUIRE(ds.attrs().size() == 2);
  }

  SECTION("empty values are skipped") {
    GlobalAttributes attrs = {{"comment", AttrValue{std::string("")}},
                              {"references", std::nullopt},
                              {"version", AttrValue{std::int64_t{0}}},
                              {"offset", AttrValue{0.0}},
                              {"title", std::nullopt}};
    REQUIRE(AttributeMerger().merge(ds, attrs) == 0);
    REQUIRE_FALSE(ds.attrs().has("comment"));
    REQUIRE_FALSE(ds.attrs().has("references"));
    REQUIRE(ds.attrs().get_string("title") == "station_a");
  }

  SECTION("is_empty") {
    REQUIRE(AttributeMerger::is_empty(std::nullopt));
    REQUIRE(AttributeMerger::is_empty(AttrValue{std::string()}));
    REQUIRE(AttributeMerger::is_empty(AttrValue{std::int32_t{0}}));
    REQUIRE_FALSE(AttributeMerger::is_empty(AttrValue{std::string("x")}));
    REQUIRE_FALSE(AttributeMerger::is_empty(AttrValue{-1.0}));
  }
}
