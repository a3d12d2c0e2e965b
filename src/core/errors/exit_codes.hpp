#pragma once

namespace recsync::core::errors {

// Process-exit contract for `recsync` so wrapper scripts can branch on the
// failure class without scraping stderr.
//
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
// - 10 configuration file invalid or unreadable
// - 20 session state conflict (already active / no active session)
// - 30 session manifest could not be written
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kSessionConflict = 20,
  kManifestWriteFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace recsync::core::errors
