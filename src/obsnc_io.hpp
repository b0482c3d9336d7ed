/**
 * @file obsnc_io.hpp
 * @brief NetCDF output for converted datasets.
 *
 * Uses the netCDF-C library directly. Every library status is checked
 * and turned into a PersistenceError naming the output file.
 */

#ifndef OBSNC_IO_HPP
#define OBSNC_IO_HPP

#include "dataset.hpp"
#include <string>

namespace obsnc {

/**
 * @brief Owning handle for an open netCDF file id.
 *
 * A handle that is destroyed while still open is aborted, which discards
 * the pending definitions and releases the id on every error path.
 */
class NcFile {
public:
  NcFile() = default;
  ~NcFile();

  NcFile(const NcFile &) = delete;
  NcFile &operator=(const NcFile &) = delete;

  /**
   * @brief Create (clobber) a NetCDF-4 file.
   * @throws PersistenceError if the file cannot be created
   */
  void create(const std::string &path);

  /**
   * @brief Open an existing file read-only.
   * @throws PersistenceError if the file cannot be opened
   */
  void open(const std::string &path);

  /**
   * @brief Close the file, flushing all data.
   * @throws PersistenceError if the library reports a failure
   */
  void close();

  bool is_open() const { return m_ncid >= 0; }
  int id() const { return m_ncid; }
  const std::string &path() const { return m_path; }

  /**
   * @brief Throw a PersistenceError if @p status is not NC_NOERR.
   * @param status netCDF return code
   * @param what Operation description used in the message
   */
  void check(int status, const std::string &what) const;

private:
  int m_ncid = -1;
  std::string m_path;
};

/**
 * @brief Persists an annotated Dataset as a NetCDF-4 file.
 *
 * ## Layout
 * - dimension `time` of length Dataset::size()
 * - variable `time` (NC_INT64) holding the coordinate
 * - one variable per data variable, NC_DOUBLE or NC_INT by storage type
 * - variable and global attributes in insertion order; `_FillValue` is
 *   applied as the variable's fill value with the variable's own type
 *
 * ## Atomicity
 * The file is written as `<name>.part` and renamed to `<name>` only once
 * it has been closed successfully. On failure the partial file is
 * removed, so an output file is either complete or absent.
 */
class NetcdfWriter {
public:
  /// Suffix of the temporary file written before the final rename.
  static constexpr const char *PARTIAL_SUFFIX = ".part";

  /**
   * @brief Write @p ds to `<output_dir>/<filename>`.
   *
   * The output directory is created (with parents) if missing.
   *
   * @return Path of the written file
   * @throws PersistenceError on any failure
   */
  std::string write(const Dataset &ds, const std::string &output_dir,
                    const std::string &filename) const;

  /**
   * @brief Output file name for an input path: base name + ".nc".
   *
   * "data/station_a.csv" -> "station_a.nc"
   */
  static std::string output_filename(const std::string &input_path);

private:
  void write_file(const Dataset &ds, const std::string &path) const;
};

} // namespace obsnc

#endif // OBSNC_IO_HPP
