//==============================================================================
// Test: FieldSchema
//
// Unit tests for the static field catalog and the policy/profile resolution.
//==============================================================================

#include "schema/field_schema.hpp"
#include <catch2/catch.hpp>

#include <stdexcept>

using namespace obsnc;

TEST_CASE("FieldSchema column order", "[unit][schema]") {
  auto schema = FieldSchema::make(NumericPolicy::ALL_FLOAT,
                                  MetadataProfile::UNITS_ONLY);

  REQUIRE(schema.fields().size() == NUM_FIELDS);

  SECTION("time is the first column") {
    REQUIRE(schema.time_field().column == "timestamp");
    REQUIRE(schema.time_field().variable == "time");
    REQUIRE(schema.time_field().is_time());
    REQUIRE(schema.time_field().storage == StorageType::INT64);
  }

  SECTION("remaining columns follow the record layout") {
    const char *expected[] = {"latitude",
                              "longitude",
                              "true_wind_speed",
                              "true_wind_direction",
                              "air_temperature",
                              "air_humidity",
                              "dew_point",
                              "immediate_air_pressure",
                              "average_air_pressure_for_last_minute",
                              "sea_level_air_pressure"};
    for (std::size_t i = 1; i < NUM_FIELDS; ++i) {
      REQUIRE(schema.field(i).column == expected[i - 1]);
      REQUIRE(schema.field(i).variable == expected[i - 1]);
      REQUIRE_FALSE(schema.field(i).is_time());
    }
  }

  SECTION("out of range position throws") {
    REQUIRE_THROWS_AS(schema.field(NUM_FIELDS), std::out_of_range);
  }
}

TEST_CASE("FieldSchema numeric policy", "[unit][schema]") {
  SECTION("all-float stores every data variable as FLOAT64") {
    auto schema = FieldSchema::make(NumericPolicy::ALL_FLOAT,
                                    MetadataProfile::UNITS_ONLY);
    for (const auto &f : schema.fields()) {
      if (!f.is_time()) {
        REQUIRE(f.storage == StorageType::FLOAT64);
      }
    }
  }

  SECTION("mixed stores direction and humidity as INT32") {
    auto schema =
        FieldSchema::make(NumericPolicy::MIXED, MetadataProfile::UNITS_ONLY);
    for (const auto &f : schema.fields()) {
      if (f.is_time()) {
        continue;
      }
      if (f.variable == "true_wind_direction" ||
          f.variable == "air_humidity") {
        REQUIRE(f.storage == StorageType::INT32);
      } else {
        REQUIRE(f.storage == StorageType::FLOAT64);
      }
    }
  }
}

TEST_CASE("FieldSchema metadata profile", "[unit][schema]") {
  SECTION("units-only uses the legacy unit strings") {
    auto schema = FieldSchema::make(NumericPolicy::ALL_FLOAT,
                                    MetadataProfile::UNITS_ONLY);
    REQUIRE(schema.find("latitude")->units == "decimal_degrees");
    REQUIRE(schema.find("true_wind_speed")->units == "m/s");
    REQUIRE(schema.find("air_temperature")->units == "degrees_celsius");
  }

  SECTION("cf uses UDUNITS strings") {
    auto schema =
        FieldSchema::make(NumericPolicy::ALL_FLOAT, MetadataProfile::CF);
    REQUIRE(schema.find("latitude")->units == "degree_north");
    REQUIRE(schema.find("longitude")->units == "degree_east");
    REQUIRE(schema.find("true_wind_speed")->units == "m s-1");
    REQUIRE(schema.find("air_temperature")->units == "degree_Celsius");
    REQUIRE(schema.find("true_wind_direction")->standard_name ==
            "wind_from_direction");
  }

  SECTION("time units are the same in both profiles") {
    auto legacy = FieldSchema::make(NumericPolicy::ALL_FLOAT,
                                    MetadataProfile::UNITS_ONLY);
    auto cf = FieldSchema::make(NumericPolicy::ALL_FLOAT, MetadataProfile::CF);
    REQUIRE(legacy.time_field().units == "seconds since 1970-01-01 00:00:00");
    REQUIRE(cf.time_field().units == legacy.time_field().units);
  }

  SECTION("every data variable has a unit and a standard name") {
    auto schema =
        FieldSchema::make(NumericPolicy::MIXED, MetadataProfile::CF);
    for (const auto &f : schema.fields()) {
      REQUIRE_FALSE(f.units.empty());
      if (!f.is_time()) {
        REQUIRE_FALSE(f.standard_name.empty());
      }
    }
  }

  SECTION("unknown variable is not found") {
    auto schema =
        FieldSchema::make(NumericPolicy::ALL_FLOAT, MetadataProfile::CF);
    REQUIRE(schema.find("salinity") == nullptr);
    REQUIRE(schema.find("timestamp") == nullptr);
  }
}

TEST_CASE("FieldSchema string conversions", "[unit][schema]") {
  SECTION("numeric policy") {
    REQUIRE(str_to_numeric_policy("all_float") == NumericPolicy::ALL_FLOAT);
    REQUIRE(str_to_numeric_policy("MIXED") == NumericPolicy::MIXED);
    REQUIRE(numeric_policy_to_str(NumericPolicy::MIXED) == "mixed");
    REQUIRE_THROWS_AS(str_to_numeric_policy("int"), std::invalid_argument);
  }

  SECTION("metadata profile") {
    REQUIRE(str_to_metadata_profile("units_only") ==
            MetadataProfile::UNITS_ONLY);
    REQUIRE(str_to_metadata_profile("CF") == MetadataProfile::CF);
    REQUIRE(metadata_profile_to_str(MetadataProfile::CF) == "cf");
    REQUIRE_THROWS_AS(str_to_metadata_profile("acdd"), std::invalid_argument);
  }
}
