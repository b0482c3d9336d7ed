/**
 * @file provenance_recorder.cpp
 * @brief Implementation of ProvenanceRecorder.
 */

#include "provenance_recorder.hpp"
#include <cstdlib>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <pwd.h>
#include <unistd.h>

namespace obsnc {

std::string ProvenanceRecorder::build_history(const ProvenanceContext &ctx) {
  auto t = std::chrono::system_clock::to_time_t(ctx.timestamp);
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ} {}: {} {} -> {}", fmt::gmtime(t),
                     ctx.user, ctx.converter, ctx.input, ctx.output);
}

void ProvenanceRecorder::apply(Dataset &ds,
                               const ProvenanceContext &ctx) const {
  ds.attrs().set("history", build_history(ctx));
}

std::string current_user() {
  for (const char *var : {"USER", "LOGNAME"}) {
    const char *value = std::getenv(var);
    if (value != nullptr && *value != '\0') {
      return value;
    }
  }
  if (const struct passwd *pw = getpwuid(getuid())) {
    if (pw->pw_name != nullptr && *pw->pw_name != '\0') {
      return pw->pw_name;
    }
  }
  return "unknown";
}

} // namespace obsnc
