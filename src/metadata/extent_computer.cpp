/**
 * @file extent_computer.cpp
 * @brief Implementation of ExtentComputer.
 */

#include "extent_computer.hpp"
#include "../obsnc_errors.hpp"
#include "../obsnc_logger.hpp"
#include "../schema/field_schema.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>

namespace obsnc {

void ExtentComputer::apply(Dataset &ds,
                           std::chrono::system_clock::time_point now) const {
  set_float_extent(ds, LAT_NAME, "geospatial_lat_min", "geospatial_lat_max");
  set_float_extent(ds, LON_NAME, "geospatial_lon_min", "geospatial_lon_max");

  auto time_range = valid_min_max(ds.time_values());
  if (time_range) {
    ds.attrs().set("time_coverage_start", time_range->first);
    ds.attrs().set("time_coverage_end", time_range->second);
  } else {
    OBSNC_LOG_WARN("'{}' has no time steps, time coverage is NaN",
                   ds.source_path());
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ds.attrs().set("time_coverage_start", nan);
    ds.attrs().set("time_coverage_end", nan);
  }

  ds.attrs().set("date_created", format_date(now));
}

void ExtentComputer::set_float_extent(Dataset &ds, const std::string &var_name,
                                      const std::string &min_attr,
                                      const std::string &max_attr) const {
  if (!ds.has_variable(var_name)) {
    throw LookupError(ds.source_path(),
                      "cannot compute extent, no variable '" + var_name + "'");
  }
  const auto &var = ds.variable(var_name);

  // Extents are reported in double precision whatever the storage type
  std::optional<std::pair<double, double>> range;
  if (const auto *d = std::get_if<std::vector<double>>(&var.data)) {
    range = valid_min_max(*d);
  } else if (const auto *i32 = std::get_if<std::vector<std::int32_t>>(&var.data)) {
    if (auto r = valid_min_max(*i32, std::optional<std::int32_t>(INT32_FILL_VALUE))) {
      range = std::make_pair(static_cast<double>(r->first),
                             static_cast<double>(r->second));
    }
  } else if (const auto *i64 = std::get_if<std::vector<std::int64_t>>(&var.data)) {
    if (auto r = valid_min_max(*i64)) {
      range = std::make_pair(static_cast<double>(r->first),
                             static_cast<double>(r->second));
    }
  }

  if (!range) {
    OBSNC_LOG_WARN("'{}' has no valid '{}' values, {} and {} are NaN",
                   ds.source_path(), var_name, min_attr, max_attr);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    range = std::make_pair(nan, nan);
  }

  ds.attrs().set(min_attr, range->first);
  ds.attrs().set(max_attr, range->second);
}

std::string
ExtentComputer::format_date(std::chrono::system_clock::time_point t) {
  return fmt::format("{:%Y-%m-%d}",
                     fmt::gmtime(std::chrono::system_clock::to_time_t(t)));
}

} // namespace obsnc
