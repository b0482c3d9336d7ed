/**
 * @file obsnc_logger.hpp
 * @brief Logging macros and initialization built on spdlog.
 *
 * All converter stages log through the spdlog default logger. Messages
 * are prefixed with the source file and line of the call site.
 */

#ifndef OBSNC_LOGGER_HPP
#define OBSNC_LOGGER_HPP

#include <spdlog/spdlog.h>
#include <string>

#define OBSNC_LOG_DEBUG(msg, ...)                                             \
  spdlog::debug(obsnc::pack_log_msg(__FILE__, __LINE__, msg), ##__VA_ARGS__)
#define OBSNC_LOG_INFO(msg, ...)                                              \
  spdlog::info(obsnc::pack_log_msg(__FILE__, __LINE__, msg), ##__VA_ARGS__)
#define OBSNC_LOG_WARN(msg, ...)                                              \
  spdlog::warn(obsnc::pack_log_msg(__FILE__, __LINE__, msg), ##__VA_ARGS__)
#define OBSNC_LOG_ERROR(msg, ...)                                             \
  spdlog::error(obsnc::pack_log_msg(__FILE__, __LINE__, msg), ##__VA_ARGS__)

namespace obsnc {

/// Name given to the logger installed by init_logging().
const std::string DefaultLoggerName = "obsnc";

/**
 * @brief Install the default logger.
 *
 * Logs go to stdout when @p log_file is empty, otherwise they are
 * appended to @p log_file. The level is one of spdlog's level names
 * ("trace", "debug", "info", "warning", "error", "critical", "off").
 *
 * @param log_file Path to log file (empty string for console)
 * @param level Runtime log level name
 * @return 1 if logging is enabled, 0 if the level is "off", -1 on error
 */
int init_logging(const std::string &log_file = "",
                 const std::string &level = "info");

/**
 * @brief Prefix a log message with "[file:line] ".
 *
 * Only the base name of @p file is kept.
 */
std::string pack_log_msg(const char *file, int line, const std::string &msg);

} // namespace obsnc

#endif // OBSNC_LOGGER_HPP
