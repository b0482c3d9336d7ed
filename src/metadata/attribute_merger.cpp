/**
 * @file attribute_merger.cpp
 * @brief Implementation of AttributeMerger.
 */

#include "attribute_merger.hpp"
#include "../obsnc_logger.hpp"
#include <type_traits>

namespace obsnc {

bool AttributeMerger::is_empty(const std::optional<AttrValue> &value) {
  if (!value) {
    return true;
  }
  return std::visit(
      [](const auto &v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return v.empty();
        } else {
          return v == T{0};
        }
      },
      *value);
}

std::size_t AttributeMerger::merge(Dataset &ds,
                                   const GlobalAttributes &attrs) const {
  std::size_t written = 0;
  for (const auto &[name, value] : attrs) {
    if (is_empty(value)) {
      OBSNC_LOG_DEBUG("Skipping empty global attribute '{}'", name);
      continue;
    }
    if (ds.attrs().has(name)) {
      OBSNC_LOG_DEBUG("Configured attribute '{}' overrides computed value",
                      name);
    }
    ds.attrs().set(name, *value);
    ++written;
  }
  return written;
}

} // namespace obsnc
