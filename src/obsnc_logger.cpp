/**
 * @file obsnc_logger.cpp
 * @brief Implementation of logging initialization.
 *
 * @see obsnc_logger.hpp
 */

#include "obsnc_logger.hpp"
#include <iostream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace obsnc {

std::string pack_log_msg(const char *file, int line, const std::string &msg) {
  std::string path(file);
  size_t pos = path.find_last_of("\\/");
  if (pos != std::string::npos) {
    return "[" + path.substr(pos + 1) + ":" + std::to_string(line) + "] " +
           msg;
  }
  return "[" + path + ":" + std::to_string(line) + "] " + msg;
}

// return code: 1->enabled, 0->disabled, negative values->errors
int init_logging(const std::string &log_file, const std::string &level) {
  auto lvl = spdlog::level::from_str(level);

  try {
    // Replace any logger left over from a previous initialization
    spdlog::drop(DefaultLoggerName);

    if (log_file.empty()) {
      spdlog::set_default_logger(spdlog::stdout_logger_mt(DefaultLoggerName));
    } else {
      spdlog::set_default_logger(
          spdlog::basic_logger_mt(DefaultLoggerName, log_file));
    }
  } catch (spdlog::spdlog_ex const &ex) {
    std::cerr << "Log init failed: " << ex.what() << std::endl;
    return -1;
  }

  spdlog::set_pattern("[%n %l] %v");
  spdlog::set_level(lvl);
  spdlog::flush_on(spdlog::level::warn);

  return lvl == spdlog::level::off ? 0 : 1;
}

} // namespace obsnc
