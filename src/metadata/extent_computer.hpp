/**
 * @file extent_computer.hpp
 * @brief Spatial and temporal coverage attributes of a Dataset.
 */

#ifndef OBSNC_EXTENT_COMPUTER_HPP
#define OBSNC_EXTENT_COMPUTER_HPP

#include "../dataset.hpp"
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace obsnc {

/**
 * @brief Minimum and maximum of the valid entries of @p values.
 *
 * NaN entries of floating point data, and @p fill entries of integer
 * data, are ignored.
 *
 * @return (min, max), or std::nullopt if there is no valid entry
 */
template <typename T>
std::optional<std::pair<T, T>> valid_min_max(const std::vector<T> &values,
                                             std::optional<T> fill = {}) {
  std::optional<std::pair<T, T>> result;
  for (const T &v : values) {
    if constexpr (std::is_floating_point_v<T>) {
      if (std::isnan(v)) {
        continue;
      }
    }
    if (fill && v == *fill) {
      continue;
    }
    if (!result) {
      result = std::make_pair(v, v);
    } else {
      if (v < result->first) {
        result->first = v;
      }
      if (v > result->second) {
        result->second = v;
      }
    }
  }
  return result;
}

/**
 * @brief Computes coverage attributes from the built variables.
 *
 * Writes, as scalar global attributes:
 * - `geospatial_lat_min`, `geospatial_lat_max` (double)
 * - `geospatial_lon_min`, `geospatial_lon_max` (double)
 * - `time_coverage_start`, `time_coverage_end` (int64 seconds)
 * - `date_created` (UTC date, YYYY-MM-DD)
 *
 * If a variable has no valid sample its two extents are set to NaN and a
 * warning is logged. The dataset stays writable; no exception is raised.
 */
class ExtentComputer {
public:
  /// Variable providing the latitude extent.
  static constexpr const char *LAT_NAME = "latitude";
  /// Variable providing the longitude extent.
  static constexpr const char *LON_NAME = "longitude";

  /**
   * @brief Add extent and creation-date attributes to @p ds.
   * @param ds Dataset built by DatasetBuilder
   * @param now Conversion time used for `date_created`
   * @throws LookupError if the latitude or longitude variable is missing
   */
  void apply(Dataset &ds, std::chrono::system_clock::time_point now) const;

  /**
   * @brief Format @p t as a UTC calendar date, "YYYY-MM-DD".
   */
  static std::string format_date(std::chrono::system_clock::time_point t);

private:
  void set_float_extent(Dataset &ds, const std::string &var_name,
                        const std::string &min_attr,
                        const std::string &max_attr) const;
};

} // namespace obsnc

#endif // OBSNC_EXTENT_COMPUTER_HPP
