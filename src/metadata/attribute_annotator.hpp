/**
 * @file attribute_annotator.hpp
 * @brief Attaches controlled-vocabulary metadata to a Dataset.
 */

#ifndef OBSNC_ATTRIBUTE_ANNOTATOR_HPP
#define OBSNC_ATTRIBUTE_ANNOTATOR_HPP

#include "../dataset.hpp"
#include "../schema/field_schema.hpp"
#include <string>
#include <utility>

namespace obsnc {

/// Value of the featureType attribute for single-station time series.
const std::string FEATURE_TYPE_TIME_SERIES = "timeSeries";

/**
 * @brief Annotates variables and the dataset from the field schema.
 *
 * The metadata profile of the schema selects what is attached:
 *
 * | attribute       | UNITS_ONLY | CF  |
 * |-----------------|------------|-----|
 * | units           | yes        | yes |
 * | standard_name   | no         | yes |
 * | long_name       | no         | yes |
 * | title (global)  | yes        | yes |
 * | featureType     | yes        | no  |
 *
 * Every lookup must succeed; an unknown variable is a LookupError, not a
 * silent skip.
 */
class AttributeAnnotator {
public:
  explicit AttributeAnnotator(FieldSchema schema)
      : m_schema(std::move(schema)) {}

  /**
   * @brief Annotate all variables and set dataset-level attributes.
   *
   * The title is derived from Dataset::source_path().
   *
   * @throws LookupError if a variable has no unit or standard name entry,
   *         or if any variable is left without units
   */
  void annotate(Dataset &ds) const;

  /**
   * @brief Check that the time coordinate and every data variable carry a
   *        non-empty `units` attribute.
   * @throws LookupError naming the first variable without units
   */
  static void verify_units(const Dataset &ds);

  /**
   * @brief Base name of @p path without its last extension.
   *
   * "data/station_a.csv" -> "station_a"
   */
  static std::string title_from_path(const std::string &path);

private:
  const FieldSpec &lookup(const Dataset &ds, const std::string &name) const;

  FieldSchema m_schema;
};

} // namespace obsnc

#endif // OBSNC_ATTRIBUTE_ANNOTATOR_HPP
