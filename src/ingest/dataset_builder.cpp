/**
 * @file dataset_builder.cpp
 * @brief Implementation of DatasetBuilder.
 */

#include "dataset_builder.hpp"
#include "../obsnc_errors.hpp"
#include "../obsnc_logger.hpp"
#include <fmt/format.h>
#include <limits>

namespace obsnc {

namespace {

bool holds_storage(const ColumnData &data, StorageType t) {
  switch (t) {
  case StorageType::INT32:
    return std::holds_alternative<std::vector<std::int32_t>>(data);
  case StorageType::INT64:
    return std::holds_alternative<std::vector<std::int64_t>>(data);
  case StorageType::FLOAT64:
  default:
    return std::holds_alternative<std::vector<double>>(data);
  }
}

AttrValue fill_value_for(StorageType t) {
  switch (t) {
  case StorageType::INT32:
    return INT32_FILL_VALUE;
  case StorageType::INT64:
    return std::numeric_limits<std::int64_t>::min();
  case StorageType::FLOAT64:
  default:
    return std::numeric_limits<double>::quiet_NaN();
  }
}

} // namespace

Dataset DatasetBuilder::build(ColumnTable table) const {
  const auto &fields = m_schema.fields();

  if (table.columns.size() != fields.size() ||
      table.names.size() != fields.size()) {
    throw FormatError(table.source,
                      fmt::format("table has {} columns, schema expects {}",
                                  table.columns.size(), fields.size()));
  }

  Dataset ds;
  ds.set_source_path(table.source);

  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto &field = fields[i];
    if (table.names[i] != field.column ||
        !holds_storage(table.columns[i], field.storage)) {
      throw FormatError(table.source,
                        fmt::format("column {} ('{}') does not match schema "
                                    "field '{}' of type {}",
                                    i + 1, table.names[i], field.column,
                                    storage_type_to_str(field.storage)));
    }
  }

  // Coordinate first so every data variable is checked against its length
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (fields[i].is_time()) {
      ds.set_time(
          std::get<std::vector<std::int64_t>>(std::move(table.columns[i])));
      break;
    }
  }

  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto &field = fields[i];
    if (field.is_time()) {
      continue;
    }
    auto &var = ds.add_variable(field.variable, std::move(table.columns[i]));
    var.attrs.set("_FillValue", fill_value_for(field.storage));
  }

  OBSNC_LOG_DEBUG("Built dataset from '{}': {} time steps, {} variables ({})",
                  table.source, ds.size(), ds.data_vars().size(),
                  numeric_policy_to_str(m_schema.policy()));
  return ds;
}

} // namespace obsnc
