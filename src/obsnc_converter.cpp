/**
 * @file obsnc_converter.cpp
 * @brief Implementation of the conversion pipeline.
 */

#include "obsnc_converter.hpp"
#include "obsnc_errors.hpp"
#include "obsnc_logger.hpp"
#include <algorithm>
#include <filesystem>

namespace obsnc {

std::size_t BatchReport::converted() const {
  return static_cast<std::size_t>(
      std::count_if(results.begin(), results.end(),
                    [](const FileResult &r) { return r.ok; }));
}

std::size_t BatchReport::failed() const {
  return results.size() - converted();
}

Converter::Converter(const ConverterOptions &options,
                     GlobalAttributes global_attributes, RunContext context)
    : m_options(options), m_global_attributes(std::move(global_attributes)),
      m_context(std::move(context)),
      m_schema(
          FieldSchema::make(options.numeric_policy, options.metadata_profile)),
      m_parser(m_schema), m_builder(m_schema), m_annotator(m_schema) {}

Dataset Converter::build_dataset(const std::string &input_path,
                                 const std::string &output_path) const {
  const auto now = m_context.clock();

  Dataset ds = m_builder.build(m_parser.parse_file(input_path));
  m_annotator.annotate(ds);
  m_extents.apply(ds, now);

  if (m_schema.profile() == MetadataProfile::CF) {
    ProvenanceContext prov;
    prov.timestamp = now;
    prov.user = m_context.user;
    prov.converter = m_context.converter_name;
    prov.input = input_path;
    prov.output = output_path;
    m_provenance.apply(ds, prov);
  }

  m_merger.merge(ds, m_global_attributes);
  return ds;
}

std::string Converter::convert_file(const std::string &input_path,
                                    const std::string &output_dir) const {
  const std::string filename = NetcdfWriter::output_filename(input_path);
  const std::string output_path =
      (std::filesystem::path(output_dir) / filename).string();

  OBSNC_LOG_INFO("Converting '{}'", input_path);
  Dataset ds = build_dataset(input_path, output_path);
  std::string written = m_writer.write(ds, output_dir, filename);
  OBSNC_LOG_INFO("NetCDF file '{}' created successfully ({} time steps)",
                 written, ds.size());
  return written;
}

BatchReport Converter::run(const std::vector<std::string> &input_paths,
                           const std::string &output_dir) const {
  BatchReport report;

  if (input_paths.empty()) {
    OBSNC_LOG_WARN("No input files configured, nothing to convert");
    return report;
  }

  OBSNC_LOG_INFO("Converting {} file(s) into '{}' (profile={}, policy={}, "
                 "on_error={})",
                 input_paths.size(), output_dir,
                 metadata_profile_to_str(m_options.metadata_profile),
                 numeric_policy_to_str(m_options.numeric_policy),
                 error_policy_to_str(m_options.on_error));

  for (const auto &input : input_paths) {
    FileResult result;
    result.input = input;
    try {
      result.output = convert_file(input, output_dir);
      result.ok = true;
      report.results.push_back(result);
    } catch (const ConversionError &e) {
      result.error = e.what();
      report.results.push_back(result);
      OBSNC_LOG_ERROR("Conversion failed: {}", e.what());
      if (m_options.on_error == ErrorPolicy::ABORT) {
        throw;
      }
    }
  }

  OBSNC_LOG_INFO("Converted {} of {} file(s)", report.converted(),
                 report.results.size());
  return report;
}

BatchReport run_conversion(const ObsncConfig &config,
                           const RunContext &context) {
  Converter converter(config.converter, config.global_attributes, context);
  return converter.run(config.input_paths, config.output_dir);
}

} // namespace obsnc
