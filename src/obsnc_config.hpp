/**
 * @file obsnc_config.hpp
 * @brief Run configuration for the observation converter.
 *
 * The configuration is a YAML file parsed with yaml-cpp. Required keys
 * are `input_path` and `output_path`; `global_attributes` and the
 * `converter` section are optional.
 *
 * ## Example YAML
 * ```yaml
 * input_path:
 *   - data/station_a.csv
 *   - data/station_b.csv
 * output_path:
 *   - out
 * global_attributes:
 *   institution: "Example Institute"
 *   license: ""
 * converter:
 *   metadata_profile: cf
 *   numeric_policy: mixed
 *   on_error: continue
 *   log_file: ""
 *   log_level: info
 * ```
 */

#ifndef OBSNC_CONFIG_HPP
#define OBSNC_CONFIG_HPP

#include "metadata/attribute_merger.hpp"
#include "schema/field_schema.hpp"
#include <string>
#include <vector>

namespace obsnc {

/**
 * @brief What the batch does when one file fails.
 */
enum class ErrorPolicy {
  ABORT,   ///< Stop at the first failed file and rethrow its error
  CONTINUE ///< Log the failure and convert the remaining files
};

/**
 * @brief Convert string to ErrorPolicy.
 * @param s "abort" or "continue" (case-insensitive)
 * @throws std::invalid_argument for any other value
 */
ErrorPolicy str_to_error_policy(const std::string &s);

/** @brief Convert ErrorPolicy to string. */
std::string error_policy_to_str(ErrorPolicy p);

/**
 * @brief Options of the `converter` section.
 */
struct ConverterOptions {
  MetadataProfile metadata_profile = MetadataProfile::UNITS_ONLY;
  NumericPolicy numeric_policy = NumericPolicy::ALL_FLOAT;
  ErrorPolicy on_error = ErrorPolicy::ABORT;
  std::string log_file;            ///< Empty for console logging
  std::string log_level = "info";  ///< spdlog level name
};

/**
 * @brief Complete run configuration.
 */
struct ObsncConfig {
  std::vector<std::string> input_paths; ///< Source files, in order
  std::string output_dir;               ///< First entry of `output_path`
  GlobalAttributes global_attributes;   ///< Merged last, in file order
  ConverterOptions converter;
};

/**
 * @brief Parse configuration from a YAML file.
 * @param yaml_file Path to the configuration file
 * @throws ConfigurationError if the file cannot be read or any key is
 *         missing or malformed
 */
ObsncConfig parse_config(const std::string &yaml_file);

/**
 * @brief Parse configuration from YAML text.
 * @param yaml_text YAML document
 * @param source_name Name used in error messages
 * @throws ConfigurationError as for parse_config()
 */
ObsncConfig parse_config_string(const std::string &yaml_text,
                                const std::string &source_name);

} // namespace obsnc

#endif // OBSNC_CONFIG_HPP
