#pragma once

#include "naming/device_model.hpp"
#include "naming/naming_config.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace recsync::naming {

inline constexpr std::string_view kCameraContainerExtension = "mkv";
inline constexpr std::string_view kAudioExtension = "wav";

// Short role token embedded in camera filenames: master, sub, standalone.
std::string_view RoleTag(CaptureRole role);

// `<timestamp>-<role_tag>-<friendly_name>.mkv`
std::string ComposeKinectFilename(std::string_view timestamp, CaptureRole role,
                                  std::string_view friendly_name);

// `<timestamp>-<friendly_name>.wav`
std::string ComposeAudioFilename(std::string_view timestamp, std::string_view friendly_name);

// Canonical filenames for one session. Holds the session timestamp and the
// naming snapshot taken at session creation; producing a name has no side
// effects, so the same inputs always yield the same string. Registering the
// name with the session is the caller's job.
class FilenameGenerator {
public:
  FilenameGenerator(std::string timestamp, NamingConfiguration naming)
      : timestamp_(std::move(timestamp)), naming_(std::move(naming)) {}

  std::string KinectFilename(CaptureRole role, std::string_view host_identifier,
                             std::uint32_t device_index) const;
  std::string AudioFilename(std::uint32_t device_index) const;

  // Dispatches on the descriptor class.
  std::string FilenameFor(const DeviceDescriptor& device) const;

  const std::string& timestamp() const { return timestamp_; }

private:
  std::string timestamp_;
  NamingConfiguration naming_;
};

} // namespace recsync::naming
