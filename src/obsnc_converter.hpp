/**
 * @file obsnc_converter.hpp
 * @brief Per-file conversion pipeline and batch driver.
 *
 * For each input file the converter runs, in order:
 *
 * 1. RecordParser      - text to typed columns
 * 2. DatasetBuilder    - columns to time-indexed Dataset
 * 3. AttributeAnnotator- units, standard/long names, title, featureType
 * 4. ExtentComputer    - geospatial/time coverage, date_created
 * 5. ProvenanceRecorder- history (CF profile only)
 * 6. AttributeMerger   - configured global attributes
 * 7. NetcdfWriter      - `<output_dir>/<input base name>.nc`
 *
 * Files are independent: no state is carried from one file to the next.
 */

#ifndef OBSNC_CONVERTER_HPP
#define OBSNC_CONVERTER_HPP

#include "dataset.hpp"
#include "ingest/dataset_builder.hpp"
#include "ingest/record_parser.hpp"
#include "metadata/attribute_annotator.hpp"
#include "metadata/attribute_merger.hpp"
#include "metadata/extent_computer.hpp"
#include "metadata/provenance_recorder.hpp"
#include "obsnc_config.hpp"
#include "obsnc_io.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace obsnc {

/**
 * @brief Process-level facts the pipeline records, supplied by the caller.
 */
struct RunContext {
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  std::string user = "unknown";        ///< Invoking user identity
  std::string converter_name = "obsnc"; ///< Name written to `history`
  Clock clock = [] { return std::chrono::system_clock::now(); };
};

/**
 * @brief Outcome of converting one input file.
 */
struct FileResult {
  std::string input;  ///< Input path
  std::string output; ///< Written file, empty on failure
  bool ok = false;
  std::string error;  ///< Error message, empty on success
};

/**
 * @brief Outcome of a batch, one entry per attempted file.
 */
struct BatchReport {
  std::vector<FileResult> results;

  std::size_t converted() const;
  std::size_t failed() const;
  bool all_ok() const { return failed() == 0; }
};

/**
 * @brief Runs the conversion pipeline for one or more input files.
 */
class Converter {
public:
  Converter(const ConverterOptions &options, GlobalAttributes global_attributes,
            RunContext context = {});

  /**
   * @brief Parse, build and fully annotate one input without writing it.
   *
   * @param input_path Source file
   * @param output_path Output identifier recorded in `history`
   * @throws FormatError, LookupError
   */
  Dataset build_dataset(const std::string &input_path,
                        const std::string &output_path) const;

  /**
   * @brief Convert one input file.
   * @return Path of the written NetCDF file
   * @throws FormatError, LookupError, PersistenceError
   */
  std::string convert_file(const std::string &input_path,
                           const std::string &output_dir) const;

  /**
   * @brief Convert files sequentially in list order.
   *
   * With ErrorPolicy::ABORT the first ConversionError is rethrown after
   * being logged; with ErrorPolicy::CONTINUE it is recorded in the report
   * and the next file is processed.
   */
  BatchReport run(const std::vector<std::string> &input_paths,
                  const std::string &output_dir) const;

private:
  ConverterOptions m_options;
  GlobalAttributes m_global_attributes;
  RunContext m_context;

  FieldSchema m_schema;
  RecordParser m_parser;
  DatasetBuilder m_builder;
  AttributeAnnotator m_annotator;
  ExtentComputer m_extents;
  ProvenanceRecorder m_provenance;
  AttributeMerger m_merger;
  NetcdfWriter m_writer;
};

/**
 * @brief Convert every input of a parsed configuration.
 */
BatchReport run_conversion(const ObsncConfig &config,
                           const RunContext &context);

} // namespace obsnc

#endif // OBSNC_CONVERTER_HPP
