#pragma once

#include "naming/device_model.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace recsync::artifacts {

inline constexpr std::string_view kAbortMarkerFileName = "session_aborted.json";

// Left in the session directory when an aborted session keeps its partial
// captures, so tooling can tell an abandoned directory from a live one.
struct AbortMarker {
  std::string timestamp;
  naming::RecordingMode mode = naming::RecordingMode::kSync;
  std::filesystem::path session_dir;
  std::vector<std::string> tracked_files;
  std::string reason;
  std::string aborted_at_utc;
};

std::string ToJson(const AbortMarker& marker);

// Writes `<session_dir>/session_aborted.json` atomically.
bool WriteAbortMarkerJson(const AbortMarker& marker, const std::filesystem::path& session_dir,
                          std::filesystem::path& written_path, std::string& error);

} // namespace recsync::artifacts
