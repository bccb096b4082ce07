#pragma once

namespace argsmap::core::errors {

// Stable process-exit contract for build scripts invoking argsmap.
//
// - 0 success (including "nothing to merge")
// - 1 generic command failure
// - 2 usage/argument failure
//
// The remaining values let the calling build step tell a broken plan from a
// broken archive or a malformed args-apt record without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kArchiveFailed = 20,
  kRecordMalformed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace argsmap::core::errors
