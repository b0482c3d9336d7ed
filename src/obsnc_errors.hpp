/**
 * @file obsnc_errors.hpp
 * @brief Exception types raised by the observation converter.
 *
 * Every error carries the path of the file that caused it so a failed
 * batch can be diagnosed from the log alone.
 */

#ifndef OBSNC_ERRORS_HPP
#define OBSNC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace obsnc {

/**
 * @brief Base class for all conversion failures.
 *
 * The message passed to what() is prefixed with the offending path.
 */
class ConversionError : public std::runtime_error {
public:
  ConversionError(const std::string &path, const std::string &message)
      : std::runtime_error(path + ": " + message), m_path(path) {}

  /** @brief Path of the file the error refers to. */
  const std::string &path() const { return m_path; }

private:
  std::string m_path;
};

/// Missing or malformed configuration. Fatal for the whole run.
class ConfigurationError : public ConversionError {
public:
  using ConversionError::ConversionError;
};

/// Input does not fit the fixed 11-column schema. Fatal for that file.
class FormatError : public ConversionError {
public:
  using ConversionError::ConversionError;
};

/// Variable name without a unit or standard-name entry.
class LookupError : public ConversionError {
public:
  using ConversionError::ConversionError;
};

/// Output artifact could not be created or finalized. Fatal for that file.
class PersistenceError : public ConversionError {
public:
  using ConversionError::ConversionError;
};

} // namespace obsnc

#endif // OBSNC_ERRORS_HPP
