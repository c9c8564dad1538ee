#pragma once

namespace sweval::core::errors {

// Stable process-exit contract for CLI automation.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify the pipeline's failure modes so batch drivers
// can tell "rebuild images" apart from "the store is inconsistent" without
// scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kMappingConflict = 40,
  kNotFound = 41,
  kBuildFailures = 42,
  kNotResolved = 50,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace sweval::core::errors
