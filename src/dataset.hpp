/**
 * @file dataset.hpp
 * @brief In-memory labeled dataset handed to the NetCDF writer.
 *
 * A Dataset holds one time coordinate and a set of 1-D data variables
 * aligned index-for-index with it, plus dataset-level attributes. It is
 * built fresh for each input file and discarded after it is written.
 */

#ifndef OBSNC_DATASET_HPP
#define OBSNC_DATASET_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace obsnc {

/// Scalar attribute value: text, 32-bit int, 64-bit int or double.
using AttrValue = std::variant<std::string, std::int32_t, std::int64_t, double>;

/// Column storage for a variable, one alternative per StorageType.
using ColumnData = std::variant<std::vector<double>, std::vector<std::int32_t>,
                                std::vector<std::int64_t>>;

/// Number of elements held by a column regardless of its element type.
std::size_t column_size(const ColumnData &data);

/// Render an attribute value as text (for logs and tests).
std::string attr_to_string(const AttrValue &value);

/**
 * @brief Attribute map that preserves insertion order.
 *
 * Setting an existing name replaces the value in place, so the name keeps
 * its original position. This mirrors how NetCDF attribute order is seen
 * by readers of the output file.
 */
class AttributeMap {
public:
  using Entry = std::pair<std::string, AttrValue>;

  /** @brief Insert or overwrite an attribute. */
  void set(const std::string &name, AttrValue value);

  /** @brief Check whether an attribute exists. */
  bool has(const std::string &name) const;

  /**
   * @brief Get an attribute value.
   * @throws std::out_of_range if the attribute does not exist
   */
  const AttrValue &get(const std::string &name) const;

  /**
   * @brief Get a text attribute, or an empty string if absent or not text.
   */
  std::string get_string(const std::string &name) const;

  /** @brief Remove an attribute if present. */
  void erase(const std::string &name);

  std::size_t size() const { return m_entries.size(); }
  bool empty() const { return m_entries.empty(); }

  std::vector<Entry>::const_iterator begin() const { return m_entries.begin(); }
  std::vector<Entry>::const_iterator end() const { return m_entries.end(); }

  bool operator==(const AttributeMap &other) const {
    return m_entries == other.m_entries;
  }

private:
  std::vector<Entry> m_entries;
};

/**
 * @brief A named 1-D variable along the time dimension.
 */
struct Variable {
  std::string name;
  ColumnData data;
  AttributeMap attrs;

  std::size_t size() const { return column_size(data); }
};

/**
 * @brief Time-indexed dataset: one coordinate plus aligned data variables.
 *
 * ## Invariant
 * Every data variable has the same length as the time coordinate. The
 * invariant is enforced when variables are added; the coordinate itself
 * can only be set while no data variables exist.
 */
class Dataset {
public:
  /// Name of the time coordinate and of the single dimension.
  static constexpr const char *TIME_NAME = "time";

  Dataset() = default;

  /**
   * @brief Set the time coordinate.
   * @param times Seconds since the epoch, in source order
   * @throws std::invalid_argument if data variables were already added
   */
  void set_time(std::vector<std::int64_t> times);

  /**
   * @brief Append a data variable aligned to the time coordinate.
   * @throws std::invalid_argument if the length does not match the time
   *         coordinate, or if the name is already in use
   */
  Variable &add_variable(const std::string &name, ColumnData data);

  /** @brief Check whether a data variable (or "time") exists. */
  bool has_variable(const std::string &name) const;

  /**
   * @brief Access a variable by name; "time" returns the coordinate.
   * @throws std::out_of_range if no such variable exists
   */
  Variable &variable(const std::string &name);
  const Variable &variable(const std::string &name) const;

  /** @brief Time coordinate variable. */
  Variable &time() { return m_time; }
  const Variable &time() const { return m_time; }

  /** @brief Time coordinate values. */
  const std::vector<std::int64_t> &time_values() const;

  /** @brief Data variables in insertion order (time excluded). */
  std::vector<Variable> &data_vars() { return m_vars; }
  const std::vector<Variable> &data_vars() const { return m_vars; }

  /** @brief Number of time steps. */
  std::size_t size() const { return m_time.size(); }

  /** @brief Dataset-level (global) attributes. */
  AttributeMap &attrs() { return m_attrs; }
  const AttributeMap &attrs() const { return m_attrs; }

  /** @brief Path of the input file this dataset was built from. */
  const std::string &source_path() const { return m_source_path; }
  void set_source_path(const std::string &path) { m_source_path = path; }

private:
  Variable m_time{TIME_NAME, std::vector<std::int64_t>{}, {}};
  std::vector<Variable> m_vars;
  AttributeMap m_attrs;
  std::string m_source_path;
};

} // namespace obsnc

#endif // OBSNC_DATASET_HPP
