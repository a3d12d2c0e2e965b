#pragma once

#include "naming/device_model.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace recsync::naming {

// Fixed subdirectory name for each mode (`sync`, `standalone`).
std::string_view ModeDirectoryName(RecordingMode mode);

// `<base_dir>/<mode>/<timestamp>`. Pure: touches no filesystem state and
// returns the same path for the same inputs.
std::filesystem::path BuildSessionPath(RecordingMode mode, std::string_view timestamp,
                                       const std::filesystem::path& base_dir);

// A timestamp becomes one path component, so it must be non-empty, must not be
// `.` or `..` and must not contain a path separator or NUL.
bool ValidateTimestampComponent(std::string_view timestamp, std::string& error);

} // namespace recsync::naming
