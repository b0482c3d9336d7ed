/**
 * @file record_parser.hpp
 * @brief Reader for header-less, comma-delimited station observation files.
 *
 * Each line holds exactly NUM_FIELDS positional values. Cells are coerced
 * to the storage type declared by the FieldSchema while reading, so the
 * resulting table is already typed column by column.
 */

#ifndef OBSNC_RECORD_PARSER_HPP
#define OBSNC_RECORD_PARSER_HPP

#include "../dataset.hpp"
#include "../schema/field_schema.hpp"
#include <cstddef>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace obsnc {

/**
 * @brief Column-oriented result of parsing one input file.
 *
 * `columns[i]` holds the values of schema field `i` in row order; its
 * alternative matches the field's StorageType.
 */
struct ColumnTable {
  std::string source;               ///< Path or name of the parsed source
  std::vector<std::string> names;   ///< Column names, in schema order
  std::vector<ColumnData> columns;  ///< One typed column per field
  std::size_t num_rows = 0;         ///< Number of records read

  /**
   * @brief Get a column by name.
   * @throws std::out_of_range if the name is not a schema column
   */
  const ColumnData &column(const std::string &name) const;
};

/**
 * @brief Parses delimited observation text into a ColumnTable.
 *
 * - No header row; blank lines are skipped.
 * - Every record must have exactly NUM_FIELDS comma-separated cells.
 * - Empty cells and the tokens nan/NA/N/A/null mark missing values in
 *   non-time columns (NaN for FLOAT64, INT32_FILL_VALUE for INT32).
 * - Any violation raises FormatError naming the source, the 1-based line
 *   and the column.
 */
class RecordParser {
public:
  explicit RecordParser(FieldSchema schema) : m_schema(std::move(schema)) {}

  /**
   * @brief Parse a file from disk.
   * @param path Input file path
   * @return Typed column table with at least one row
   * @throws FormatError if the file cannot be opened, is empty, or holds a
   *         malformed record
   */
  ColumnTable parse_file(const std::string &path) const;

  /**
   * @brief Parse records from a stream.
   * @param in Input stream
   * @param source_name Name used in diagnostics and stored on the table
   * @throws FormatError as for parse_file()
   */
  ColumnTable parse(std::istream &in, const std::string &source_name) const;

private:
  FieldSchema m_schema;
};

} // namespace obsnc

#endif // OBSNC_RECORD_PARSER_HPP
