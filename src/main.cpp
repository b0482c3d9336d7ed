/**
 * @file main.cpp
 * @brief Command-line entry point of the observation converter.
 *
 * Usage: `obsnc [config.yaml]`. The configuration file defaults to
 * `config.yaml` in the working directory. The process exits with 0 when
 * every listed file was converted and 1 otherwise.
 */

#include "obsnc_config.hpp"
#include "obsnc_converter.hpp"
#include "obsnc_errors.hpp"
#include "obsnc_logger.hpp"
#include "metadata/provenance_recorder.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void print_usage(const char *prog) {
  std::cerr << "usage: " << prog << " [config.yaml]" << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }
  const std::string arg = argc > 1 ? argv[1] : "";
  if (arg == "-h" || arg == "--help") {
    print_usage(argv[0]);
    return 0;
  }
  const std::string config_file = arg.empty() ? "config.yaml" : arg;

  // Console logging until the configuration says otherwise
  obsnc::init_logging();

  obsnc::ObsncConfig config;
  try {
    config = obsnc::parse_config(config_file);
  } catch (const obsnc::ConfigurationError &e) {
    OBSNC_LOG_ERROR("Invalid configuration: {}", e.what());
    return 1;
  }

  if (obsnc::init_logging(config.converter.log_file,
                          config.converter.log_level) < 0) {
    std::cerr << "obsnc: cannot open log file '" << config.converter.log_file
              << "'" << std::endl;
    return 1;
  }

  obsnc::RunContext context;
  context.user = obsnc::current_user();
  const std::string prog = std::filesystem::path(argv[0]).filename().string();
  context.converter_name = prog.empty() ? "obsnc" : prog;

  try {
    obsnc::BatchReport report = obsnc::run_conversion(config, context);
    for (const auto &r : report.results) {
      if (!r.ok) {
        OBSNC_LOG_WARN("Not converted: {}", r.error);
      }
    }
    return report.all_ok() ? 0 : 1;
  } catch (const obsnc::ConversionError &e) {
    OBSNC_LOG_ERROR("Conversion aborted: {}", e.what());
    return 1;
  }
}
