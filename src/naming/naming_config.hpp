#pragma once

#include "naming/device_model.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace recsync::naming {

using IndexNameTable = std::map<std::uint32_t, std::string>;

// Read-only naming inputs owned by the configuration layer. A session copies
// this snapshot when it is created, so later config edits never change names
// already handed out for that session.
//
// `camera_names` is keyed by host identifier; the reserved `local` bucket holds
// names for cameras attached to the coordinating machine.
struct NamingConfiguration {
  std::map<std::string, IndexNameTable> camera_names;
  IndexNameTable audio_names;
  std::filesystem::path base_output_dir = "recordings";
  std::string timestamp_format = "%Y-%m-%d_%H-%M-%S";
  RecordingMode default_mode = RecordingMode::kSync;

  bool operator==(const NamingConfiguration& other) const = default;
};

} // namespace recsync::naming
