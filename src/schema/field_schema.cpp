/**
 * @file field_schema.cpp
 * @brief Static field catalog and its resolution per policy/profile.
 */

#include "field_schema.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace obsnc {

namespace {

std::string to_lower(const std::string &s) {
  std::string result = s;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

/**
 * @brief One row of the static catalog.
 *
 * Storage is annotated per numeric policy and units per metadata
 * profile; a new policy or profile adds a column here only.
 */
struct CatalogEntry {
  const char *column;
  const char *variable;
  StorageType all_float_storage;
  StorageType mixed_storage;
  const char *legacy_units;
  const char *cf_units;
  const char *standard_name;
};

using ST = StorageType;

constexpr const char *TIME_UNITS = "seconds since 1970-01-01 00:00:00";

// clang-format off
const std::array<CatalogEntry, NUM_FIELDS> CATALOG = {{
  {"timestamp", "time", ST::INT64, ST::INT64,
   TIME_UNITS, TIME_UNITS, ""},
  {"latitude", "latitude", ST::FLOAT64, ST::FLOAT64,
   "decimal_degrees", "degree_north", "latitude"},
  {"longitude", "longitude", ST::FLOAT64, ST::FLOAT64,
   "decimal_degrees", "degree_east", "longitude"},
  {"true_wind_speed", "true_wind_speed", ST::FLOAT64, ST::FLOAT64,
   "m/s", "m s-1", "wind_speed"},
  {"true_wind_direction", "true_wind_direction", ST::FLOAT64, ST::INT32,
   "degrees", "degrees", "wind_from_direction"},
  {"air_temperature", "air_temperature", ST::FLOAT64, ST::FLOAT64,
   "degrees_celsius", "degree_Celsius", "air_temperature"},
  {"air_humidity", "air_humidity", ST::FLOAT64, ST::INT32,
   "percent", "percent", "humidity_mixing_ratio"},
  {"dew_point", "dew_point", ST::FLOAT64, ST::FLOAT64,
   "degrees_celsius", "degree_Celsius", "dew_point_temperature"},
  {"immediate_air_pressure", "immediate_air_pressure", ST::FLOAT64, ST::FLOAT64,
   "hPa", "hPa", "air_pressure"},
  {"average_air_pressure_for_last_minute", "average_air_pressure_for_last_minute",
   ST::FLOAT64, ST::FLOAT64,
   "hPa", "hPa s-1", "tendency_of_air_pressure"},
  {"sea_level_air_pressure", "sea_level_air_pressure", ST::FLOAT64, ST::FLOAT64,
   "hPa", "hPa", "air_pressure_at_mean_sea_level"},
}};
// clang-format on

} // namespace

NumericPolicy str_to_numeric_policy(const std::string &s) {
  std::string lower = to_lower(s);
  if (lower == "all_float" || lower == "float") {
    return NumericPolicy::ALL_FLOAT;
  } else if (lower == "mixed") {
    return NumericPolicy::MIXED;
  }
  throw std::invalid_argument("Unknown numeric policy '" + s +
                              "' (expected all_float or mixed)");
}

std::string numeric_policy_to_str(NumericPolicy p) {
  switch (p) {
  case NumericPolicy::MIXED:
    return "mixed";
  case NumericPolicy::ALL_FLOAT:
  default:
    return "all_float";
  }
}

MetadataProfile str_to_metadata_profile(const std::string &s) {
  std::string lower = to_lower(s);
  if (lower == "units_only" || lower == "units") {
    return MetadataProfile::UNITS_ONLY;
  } else if (lower == "cf") {
    return MetadataProfile::CF;
  }
  throw std::invalid_argument("Unknown metadata profile '" + s +
                              "' (expected units_only or cf)");
}

std::string metadata_profile_to_str(MetadataProfile p) {
  switch (p) {
  case MetadataProfile::CF:
    return "cf";
  case MetadataProfile::UNITS_ONLY:
  default:
    return "units_only";
  }
}

std::string storage_type_to_str(StorageType t) {
  switch (t) {
  case StorageType::INT32:
    return "int32";
  case StorageType::INT64:
    return "int64";
  case StorageType::FLOAT64:
  default:
    return "float64";
  }
}

FieldSchema FieldSchema::make(NumericPolicy policy, MetadataProfile profile) {
  FieldSchema schema;
  schema.m_policy = policy;
  schema.m_profile = profile;
  schema.m_fields.reserve(CATALOG.size());

  for (const auto &entry : CATALOG) {
    FieldSpec spec;
    spec.column = entry.column;
    spec.variable = entry.variable;
    spec.storage = (policy == NumericPolicy::MIXED) ? entry.mixed_storage
                                                    : entry.all_float_storage;
    spec.units = (profile == MetadataProfile::CF) ? entry.cf_units
                                                  : entry.legacy_units;
    spec.standard_name = entry.standard_name;
    schema.m_fields.push_back(spec);
  }

  return schema;
}

const FieldSpec *FieldSchema::find(const std::string &variable) const {
  auto it = std::find_if(
      m_fields.begin(), m_fields.end(),
      [&](const FieldSpec &f) { return f.variable == variable; });
  return it != m_fields.end() ? &*it : nullptr;
}

} // namespace obsnc
