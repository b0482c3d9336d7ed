/**
 * @file provenance_recorder.hpp
 * @brief Builds the `history` audit attribute of an output file.
 */

#ifndef OBSNC_PROVENANCE_RECORDER_HPP
#define OBSNC_PROVENANCE_RECORDER_HPP

#include "../dataset.hpp"
#include <chrono>
#include <string>

namespace obsnc {

/**
 * @brief Everything the history line records about one conversion.
 *
 * All members are supplied by the caller; the recorder reads no process
 * state of its own.
 */
struct ProvenanceContext {
  std::chrono::system_clock::time_point timestamp; ///< Conversion time
  std::string user;      ///< Invoking user or session identity
  std::string converter; ///< Name of the converting program
  std::string input;     ///< Input file identifier
  std::string output;    ///< Output file identifier
};

/**
 * @brief Writes the `history` global attribute.
 *
 * Format: `<YYYY-MM-DDTHH:MM:SSZ> <user>: <converter> <input> -> <output>`
 */
class ProvenanceRecorder {
public:
  /** @brief Build the history line for @p ctx. */
  static std::string build_history(const ProvenanceContext &ctx);

  /** @brief Set the `history` attribute of @p ds. */
  void apply(Dataset &ds, const ProvenanceContext &ctx) const;
};

/**
 * @brief Identity of the invoking user.
 *
 * Resolved from $USER, then $LOGNAME, then the password database entry of
 * the real user id; "unknown" if none is available.
 */
std::string current_user();

} // namespace obsnc

#endif // OBSNC_PROVENANCE_RECORDER_HPP
