/**
 * @file field_schema.hpp
 * @brief Fixed catalog of the 11 station observation fields.
 *
 * Each field carries its target variable name, its storage type under
 * the selected numeric policy, its unit string under the selected
 * metadata profile, and its CF standard name. The catalog is the single
 * lookup table used by the parser, the dataset builder and the
 * attribute annotator.
 */

#ifndef OBSNC_FIELD_SCHEMA_HPP
#define OBSNC_FIELD_SCHEMA_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace obsnc {

// ============================================================================
// Enums
// ============================================================================

/**
 * @brief Numeric storage type of a variable.
 */
enum class StorageType {
  FLOAT64, ///< IEEE double, NaN marks a missing value
  INT32,   ///< 32-bit signed integer, INT32_FILL_VALUE marks a missing value
  INT64    ///< 64-bit signed integer (time coordinate)
};

/**
 * @brief Numeric typing policy for the data variables.
 */
enum class NumericPolicy {
  ALL_FLOAT, ///< Every data variable stored as FLOAT64
  MIXED      ///< Wind direction and humidity stored as INT32
};

/**
 * @brief Metadata profile applied by the attribute annotator.
 *
 * The profile also selects the unit convention, so the two unit tables
 * are never mixed within one output file.
 */
enum class MetadataProfile {
  UNITS_ONLY, ///< Legacy unit strings, featureType, no standard names
  CF          ///< UDUNITS strings, standard_name, long_name, history
};

/// Fill value for missing INT32 cells (netCDF default int fill).
constexpr std::int32_t INT32_FILL_VALUE = -2147483647;

/// Number of positional columns in every input row.
constexpr std::size_t NUM_FIELDS = 11;

/// Column name of the time field in the input.
const std::string TIME_COLUMN = "timestamp";

// ============================================================================
// Conversion Utilities
// ============================================================================

/**
 * @brief Convert string to NumericPolicy.
 * @param s "all_float" or "mixed" (case-insensitive)
 * @throws std::invalid_argument for any other value
 */
NumericPolicy str_to_numeric_policy(const std::string &s);

/** @brief Convert NumericPolicy to string. */
std::string numeric_policy_to_str(NumericPolicy p);

/**
 * @brief Convert string to MetadataProfile.
 * @param s "units_only" or "cf" (case-insensitive)
 * @throws std::invalid_argument for any other value
 */
MetadataProfile str_to_metadata_profile(const std::string &s);

/** @brief Convert MetadataProfile to string. */
std::string metadata_profile_to_str(MetadataProfile p);

/** @brief Convert StorageType to string ("float64", "int32", "int64"). */
std::string storage_type_to_str(StorageType t);

// ============================================================================
// Schema
// ============================================================================

/**
 * @brief One resolved field of the schema.
 */
struct FieldSpec {
  std::string column;        ///< Positional column name in the input
  std::string variable;      ///< Variable name in the dataset
  StorageType storage;       ///< Storage type under the numeric policy
  std::string units;         ///< Unit string under the metadata profile
  std::string standard_name; ///< CF standard name (empty for time)

  bool is_time() const { return column == TIME_COLUMN; }
};

/**
 * @brief Ordered field catalog resolved for one policy and profile.
 *
 * ## Usage
 * ```cpp
 * auto schema = FieldSchema::make(NumericPolicy::MIXED, MetadataProfile::CF);
 * const FieldSpec *f = schema.find("air_humidity");
 * // f->storage == StorageType::INT32, f->units == "percent"
 * ```
 */
class FieldSchema {
public:
  /**
   * @brief Resolve the static catalog for a policy and a profile.
   */
  static FieldSchema make(NumericPolicy policy, MetadataProfile profile);

  /** @brief Fields in input column order (time first). */
  const std::vector<FieldSpec> &fields() const { return m_fields; }

  /** @brief Field at column position @p i. */
  const FieldSpec &field(std::size_t i) const { return m_fields.at(i); }

  /** @brief The time field (column 0). */
  const FieldSpec &time_field() const { return m_fields.front(); }

  /**
   * @brief Look up a field by its variable name.
   * @return Pointer to the field, or nullptr if the name is unknown
   */
  const FieldSpec *find(const std::string &variable) const;

  NumericPolicy policy() const { return m_policy; }
  MetadataProfile profile() const { return m_profile; }

private:
  FieldSchema() = default;

  std::vector<FieldSpec> m_fields;
  NumericPolicy m_policy = NumericPolicy::ALL_FLOAT;
  MetadataProfile m_profile = MetadataProfile::UNITS_ONLY;
};

} // namespace obsnc

#endif // OBSNC_FIELD_SCHEMA_HPP
