#ifndef RECSYNC_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
#define RECSYNC_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

#include "artifacts/session_manifest_writer.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace recsync::artifacts {

// Prepares the directory of a new recording session.
//
// Contract:
// - an absent path is created (with parents); `created` is set
// - an existing directory without `session_info.json` is accepted; it is
//   either empty or left behind by an aborted session at the same timestamp
// - a directory holding a finalized manifest is rejected so a completed
//   session is never reopened
// - an existing non-directory at the path is rejected
inline bool EnsureSessionDir(const std::filesystem::path& session_dir, bool& created,
                             std::string& error) {
  created = false;
  if (session_dir.empty()) {
    error = "session directory cannot be empty";
    return false;
  }

  std::error_code ec;
  const auto status = std::filesystem::status(session_dir, ec);
  if (std::filesystem::exists(status)) {
    if (!std::filesystem::is_directory(status)) {
      error = "session path exists and is not a directory: '" + session_dir.string() + "'";
      return false;
    }
    const std::filesystem::path manifest = session_dir / std::string(kSessionManifestFileName);
    if (std::filesystem::exists(manifest, ec) || ec) {
      error = ec ? "failed to inspect session directory '" + session_dir.string() +
                       "': " + ec.message()
                 : "session directory already holds a finalized session: '" +
                       session_dir.string() + "'";
      return false;
    }
    return true;
  }

  ec.clear();
  std::filesystem::create_directories(session_dir, ec);
  if (ec) {
    error = "failed to create session directory '" + session_dir.string() + "': " + ec.message();
    return false;
  }
  created = true;
  return true;
}

} // namespace recsync::artifacts

#endif // RECSYNC_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
