/**
 * @file dataset.cpp
 * @brief Implementation of the in-memory Dataset.
 */

#include "dataset.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>
#include <type_traits>

namespace obsnc {

std::size_t column_size(const ColumnData &data) {
  return std::visit([](const auto &values) { return values.size(); }, data);
}

std::string attr_to_string(const AttrValue &value) {
  return std::visit(
      [](const auto &v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v;
        } else {
          return fmt::format("{}", v);
        }
      },
      value);
}

// ============================================================================
// AttributeMap
// ============================================================================

void AttributeMap::set(const std::string &name, AttrValue value) {
  auto it = std::find_if(m_entries.begin(), m_entries.end(),
                         [&](const Entry &e) { return e.first == name; });
  if (it != m_entries.end()) {
    it->second = std::move(value);
  } else {
    m_entries.emplace_back(name, std::move(value));
  }
}

bool AttributeMap::has(const std::string &name) const {
  return std::any_of(m_entries.begin(), m_entries.end(),
                     [&](const Entry &e) { return e.first == name; });
}

const AttrValue &AttributeMap::get(const std::string &name) const {
  for (const auto &e : m_entries) {
    if (e.first == name) {
      return e.second;
    }
  }
  throw std::out_of_range("No attribute named '" + name + "'");
}

std::string AttributeMap::get_string(const std::string &name) const {
  for (const auto &e : m_entries) {
    if (e.first == name) {
      if (const auto *s = std::get_if<std::string>(&e.second)) {
        return *s;
      }
      return "";
    }
  }
  return "";
}

void AttributeMap::erase(const std::string &name) {
  m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(),
                                 [&](const Entry &e) { return e.first == name; }),
                  m_entries.end());
}

// ============================================================================
// Dataset
// ============================================================================

void Dataset::set_time(std::vector<std::int64_t> times) {
  if (!m_vars.empty()) {
    throw std::invalid_argument(
        "Time coordinate must be set before data variables are added");
  }
  m_time.data = std::move(times);
}

Variable &Dataset::add_variable(const std::string &name, ColumnData data) {
  if (has_variable(name)) {
    throw std::invalid_argument("Variable '" + name + "' already exists");
  }
  const std::size_t n = column_size(data);
  if (n != size()) {
    throw std::invalid_argument(
        fmt::format("Variable '{}' has {} values but the time coordinate has {}",
                    name, n, size()));
  }
  m_vars.push_back(Variable{name, std::move(data), {}});
  return m_vars.back();
}

bool Dataset::has_variable(const std::string &name) const {
  if (name == TIME_NAME) {
    return true;
  }
  return std::any_of(m_vars.begin(), m_vars.end(),
                     [&](const Variable &v) { return v.name == name; });
}

Variable &Dataset::variable(const std::string &name) {
  return const_cast<Variable &>(
      static_cast<const Dataset &>(*this).variable(name));
}

const Variable &Dataset::variable(const std::string &name) const {
  if (name == TIME_NAME) {
    return m_time;
  }
  for (const auto &v : m_vars) {
    if (v.name == name) {
      return v;
    }
  }
  throw std::out_of_range("No variable named '" + name + "'");
}

const std::vector<std::int64_t> &Dataset::time_values() const {
  return std::get<std::vector<std::int64_t>>(m_time.data);
}

} // namespace obsnc
