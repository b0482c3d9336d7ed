/**
 * @file dataset_builder.hpp
 * @brief Assembles a Dataset from a parsed ColumnTable.
 */

#ifndef OBSNC_DATASET_BUILDER_HPP
#define OBSNC_DATASET_BUILDER_HPP

#include "../dataset.hpp"
#include "../schema/field_schema.hpp"
#include "record_parser.hpp"

namespace obsnc {

/**
 * @brief Builds the time-indexed Dataset for one input file.
 *
 * The `timestamp` column becomes the time coordinate exactly as read
 * (no sorting, no deduplication). Every other column becomes a data
 * variable stored with the StorageType the schema declares for it, and
 * receives a `_FillValue` matching that type.
 */
class DatasetBuilder {
public:
  explicit DatasetBuilder(FieldSchema schema) : m_schema(std::move(schema)) {}

  /**
   * @brief Build a dataset from a parsed table.
   *
   * The table is consumed; its columns are moved into the dataset.
   *
   * @param table Table produced by RecordParser with the same schema
   * @return Dataset with one coordinate and NUM_FIELDS - 1 data variables
   * @throws FormatError if a column's type disagrees with the schema
   */
  Dataset build(ColumnTable table) const;

private:
  FieldSchema m_schema;
};

} // namespace obsnc

#endif // OBSNC_DATASET_BUILDER_HPP
