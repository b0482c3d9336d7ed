/**
 * @file attribute_merger.hpp
 * @brief Merges configured global attributes into a Dataset.
 */

#ifndef OBSNC_ATTRIBUTE_MERGER_HPP
#define OBSNC_ATTRIBUTE_MERGER_HPP

#include "../dataset.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace obsnc {

/**
 * @brief Configured global attributes in configuration order.
 *
 * An empty optional stands for a value that has no attribute
 * representation (null, false, empty list or mapping).
 */
using GlobalAttributes =
    std::vector<std::pair<std::string, std::optional<AttrValue>>>;

/**
 * @brief Layers deployment-specific global attributes over computed ones.
 *
 * Each non-empty entry overwrites any attribute of the same name; empty
 * entries are skipped and never delete an existing attribute.
 */
class AttributeMerger {
public:
  /**
   * @brief Merge @p attrs into the global attributes of @p ds.
   * @return Number of attributes written
   */
  std::size_t merge(Dataset &ds, const GlobalAttributes &attrs) const;

  /**
   * @brief True for values that are skipped: no value, an empty string,
   *        or numeric zero.
   */
  static bool is_empty(const std::optional<AttrValue> &value);
};

} // namespace obsnc

#endif // OBSNC_ATTRIBUTE_MERGER_HPP
