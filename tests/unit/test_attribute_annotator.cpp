//==============================================================================
// Test: AttributeAnnotator
//
// Unit tests for unit, standard name and title annotation in both profiles.
//==============================================================================

#include "metadata/attribute_annotator.hpp"
#include "obsnc_errors.hpp"
#include "test_data.hpp"
#include <catch2/catch.hpp>

using namespace obsnc;
using namespace obsnc::testing;

TEST_CASE("AttributeAnnotator units-only profile", "[unit][annotator]") {
  auto schema =
      FieldSchema::make(NumericPolicy::ALL_FLOAT, MetadataProfile::UNITS_ONLY);
  auto ds = build_from_text(schema, SCENARIO_ROW, "data/station_a.csv");
  AttributeAnnotator(schema).annotate(ds);

  SECTION("every variable has units") {
    REQUIRE(ds.time().attrs.get_string("units") ==
            "seconds since 1970-01-01 00:00:00");
    for (const auto &var : ds.data_vars()) {
      REQUIRE_FALSE(var.attrs.get_string("units").empty());
    }
    REQUIRE(ds.variable("latitude").attrs.get_string("units") ==
            "decimal_degrees");
    REQUIRE(ds.variable("true_wind_speed").attrs.get_string("units") == "m/s");
  }

  SECTION("no CF names") {
    for (const auto &var : ds.data_vars()) {
      REQUIRE_FALSE(var.attrs.has("standard_name"));
      REQUIRE_FALSE(var.attrs.has("long_name"));
    }
  }

  SECTION("featureType and title") {
    REQUIRE(ds.attrs().get_string("featureType") == "timeSeries");
    REQUIRE(ds.attrs().get_string("title") == "station_a");
  }
}

TEST_CASE("AttributeAnnotator cf profile", "[unit][annotator]") {
  auto schema = FieldSchema::make(NumericPolicy::MIXED, MetadataProfile::CF);
  auto ds = build_from_text(schema, SCENARIO_ROW, "/tmp/buoy.42.csv");
  AttributeAnnotator(schema).annotate(ds);

  REQUIRE(ds.variable("latitude").attrs.get_string("units") == "degree_north");
  REQUIRE(ds.variable("latitude").attrs.get_string("standard_name") ==
          "latitude");
  REQUIRE(ds.variable("sea_level_air_pressure").attrs.get_string(
              "standard_name") == "air_pressure_at_mean_sea_level");

  for (const auto &var : ds.data_vars()) {
    REQUIRE_FALSE(var.attrs.get_string("standard_name").empty());
    REQUIRE(var.attrs.get_string("long_name") == var.name);
  }
  REQUIRE_FALSE(ds.attrs().has("featureType"));
  REQUIRE(ds.attrs().get_string("title") == "buoy.42");
}

TEST_CASE("AttributeAnnotator lookup failures", "[unit][annotator]") {
  auto schema =
      FieldSchema::make(NumericPolicy::ALL_FLOAT, MetadataProfile::UNITS_ONLY);

  SECTION("variable without a catalog entry") {
    Dataset ds;
    ds.set_source_path("odd.csv");
    ds.set_time({1});
    ds.add_variable("salinity", std::vector<double>{35.0});
    try {
      AttributeAnnotator(schema).annotate(ds);
      FAIL("expected LookupError");
    } catch (const LookupError &e) {
      REQUIRE(e.path() == "odd.csv");
      REQUIRE(std::string(e.what()).find("salinity") != std::string::npos);
    }
  }

  SECTION("verify_units catches a variable left without units") {
    auto ds = build_from_text(schema, SCENARIO_ROW);
    AttributeAnnotator(schema).annotate(ds);
    ds.variable("dew_point").attrs.erase("units");
    REQUIRE_THROWS_AS(AttributeAnnotator::verify_units(ds), LookupError);
  }
}
