/**
 * @file record_parser.cpp
 * @brief Implementation of RecordParser.
 */

#include "record_parser.hpp"
#include "../obsnc_errors.hpp"
#include "../obsnc_logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace obsnc {

namespace {

std::string trim(const std::string &s) {
  const auto start = s.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t");
  return s.substr(start, end - start + 1);
}

std::vector<std::string> split_cells(const std::string &line) {
  std::vector<std::string> cells;
  std::string::size_type start = 0;
  while (true) {
    auto pos = line.find(',', start);
    if (pos == std::string::npos) {
      cells.push_back(trim(line.substr(start)));
      break;
    }
    cells.push_back(trim(line.substr(start, pos - start)));
    start = pos + 1;
  }
  return cells;
}

const char *const UTF8_BOM = "\xEF\xBB\xBF";

// Lower-case forms of the tokens spreadsheet and pandas exports use for
// an absent value.
const std::array<const char *, 14> MISSING_TOKENS = {
    {"nan", "-nan", "na", "n/a", "null", "none", "<na>", "#na", "#n/a",
     "#n/a n/a", "1.#ind", "-1.#ind", "1.#qnan", "-1.#qnan"}};

bool is_missing_token(const std::string &cell) {
  if (cell.empty()) {
    return true;
  }
  std::string lower = cell;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return std::find(MISSING_TOKENS.begin(), MISSING_TOKENS.end(), lower) !=
         MISSING_TOKENS.end();
}

// Whole-cell conversion; returns false on trailing garbage or overflow.
// Underflow to a subnormal or zero is a valid value.
bool to_double(const std::string &cell, double &value) {
  const char *begin = cell.c_str();
  char *end = nullptr;
  errno = 0;
  value = std::strtod(begin, &end);
  if (end == begin || *end != '\0') {
    return false;
  }
  return errno != ERANGE || std::fabs(value) != HUGE_VAL;
}

bool to_int64(const std::string &cell, std::int64_t &value) {
  const char *begin = cell.c_str();
  char *end = nullptr;
  errno = 0;
  long long v = std::strtoll(begin, &end, 10);
  if (end != begin && *end == '\0' && errno != ERANGE) {
    value = static_cast<std::int64_t>(v);
    return true;
  }

  // Accept integral decimals such as "1700000000.0"
  double d = 0.0;
  if (!to_double(cell, d) || !std::isfinite(d) || std::trunc(d) != d ||
      d < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
      d >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return false;
  }
  value = static_cast<std::int64_t>(d);
  return true;
}

bool to_int32(const std::string &cell, std::int32_t &value) {
  std::int64_t v = 0;
  if (!to_int64(cell, v) || v < std::numeric_limits<std::int32_t>::min() ||
      v > std::numeric_limits<std::int32_t>::max()) {
    return false;
  }
  value = static_cast<std::int32_t>(v);
  return true;
}

ColumnData make_column(StorageType t) {
  switch (t) {
  case StorageType::INT32:
    return std::vector<std::int32_t>{};
  case StorageType::INT64:
    return std::vector<std::int64_t>{};
  case StorageType::FLOAT64:
  default:
    return std::vector<double>{};
  }
}

} // namespace

const ColumnData &ColumnTable::column(const std::string &name) const {
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) {
      return columns[i];
    }
  }
  throw std::out_of_range("No column named '" + name + "'");
}

ColumnTable RecordParser::parse_file(const std::string &path) const {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw FormatError(path, "cannot open input file");
  }
  return parse(file, path);
}

ColumnTable RecordParser::parse(std::istream &in,
                                const std::string &source_name) const {
  const auto &fields = m_schema.fields();

  ColumnTable table;
  table.source = source_name;
  for (const auto &f : fields) {
    table.names.push_back(f.column);
    table.columns.push_back(make_column(f.storage));
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line_no == 1 && line.compare(0, 3, UTF8_BOM) == 0) {
      line.erase(0, 3);
    }
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (trim(line).empty()) {
      continue;
    }

    auto cells = split_cells(line);
    if (cells.size() != NUM_FIELDS) {
      throw FormatError(source_name,
                        fmt::format("line {}: expected {} columns, found {}",
                                    line_no, NUM_FIELDS, cells.size()));
    }

    for (std::size_t i = 0; i < NUM_FIELDS; ++i) {
      const auto &field = fields[i];
      const auto &cell = cells[i];
      const bool missing = is_missing_token(cell);

      auto bad_cell = [&](const char *expected) {
        return FormatError(
            source_name,
            fmt::format("line {}, column {} ('{}'): cannot convert '{}' to {}",
                        line_no, i + 1, field.column, cell, expected));
      };

      switch (field.storage) {
      case StorageType::INT64: {
        std::int64_t v = 0;
        if (missing || !to_int64(cell, v)) {
          throw bad_cell("a 64-bit integer");
        }
        std::get<std::vector<std::int64_t>>(table.columns[i]).push_back(v);
        break;
      }
      case StorageType::INT32: {
        std::int32_t v = INT32_FILL_VALUE;
        if (!missing && !to_int32(cell, v)) {
          throw bad_cell("a 32-bit integer");
        }
        std::get<std::vector<std::int32_t>>(table.columns[i]).push_back(v);
        break;
      }
      case StorageType::FLOAT64:
      default: {
        double v = std::numeric_limits<double>::quiet_NaN();
        if (!missing && !to_double(cell, v)) {
          throw bad_cell("a floating point number");
        }
        std::get<std::vector<double>>(table.columns[i]).push_back(v);
        break;
      }
      }
    }
    ++table.num_rows;
  }

  if (in.bad()) {
    throw FormatError(source_name, "read error");
  }
  if (table.num_rows == 0) {
    throw FormatError(source_name, "no records found");
  }

  OBSNC_LOG_DEBUG("Parsed {} records from '{}'", table.num_rows, source_name);
  return table;
}

} // namespace obsnc
