#include "naming/path_builder.hpp"

namespace recsync::naming {

std::string_view ModeDirectoryName(const RecordingMode mode) {
  return ToString(mode);
}

std::filesystem::path BuildSessionPath(const RecordingMode mode, std::string_view timestamp,
                                       const std::filesystem::path& base_dir) {
  return base_dir / std::filesystem::path(std::string(ModeDirectoryName(mode))) /
         std::filesystem::path(std::string(timestamp));
}

bool ValidateTimestampComponent(std::string_view timestamp, std::string& error) {
  if (timestamp.empty()) {
    error = "session timestamp cannot be empty";
    return false;
  }
  if (timestamp == "." || timestamp == "..") {
    error = "session timestamp cannot be '" + std::string(timestamp) + "'";
    return false;
  }
  if (timestamp.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos) {
    error = "session timestamp must not contain path separators: '" + std::string(timestamp) + "'";
    return false;
  }
  return true;
}

} // namespace recsync::naming
