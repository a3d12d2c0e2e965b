#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace recsync::naming {

// Kind of capture source. Cameras are addressed by (host, index); audio inputs
// only by index on the coordinating machine.
enum class DeviceClass {
  kCamera = 0,
  kAudio,
};

// Function of a camera inside a sync group. Audio devices carry no role.
enum class CaptureRole {
  kMaster = 0,
  kSubordinate,
  kStandalone,
};

// Session-level topology. Also selects the mode subdirectory of the output
// tree (`<base>/<mode>/<timestamp>`).
enum class RecordingMode {
  kStandalone = 0,
  kSync,
};

// Identity of one physical capture source for naming purposes.
//
// `host_identifier` is a loopback/local marker (`local`, `127.0.0.1`, ...) or
// the network address of the machine the camera is attached to. It is ignored
// for audio devices.
struct DeviceDescriptor {
  DeviceClass device_class = DeviceClass::kCamera;
  CaptureRole role = CaptureRole::kStandalone;
  std::string host_identifier;
  std::uint32_t device_index = 0;

  bool operator==(const DeviceDescriptor& other) const = default;
};

const char* ToString(DeviceClass device_class);
const char* ToString(CaptureRole role);
const char* ToString(RecordingMode mode);

// Accepts `camera` (and the legacy `kinect`) or `audio`.
bool ParseDeviceClass(std::string_view text, DeviceClass& device_class);

// Accepts `master`, `subordinate`, `sub` and `standalone`.
bool ParseCaptureRole(std::string_view text, CaptureRole& role);

// Accepts `sync` and `standalone`.
bool ParseRecordingMode(std::string_view text, RecordingMode& mode);

} // namespace recsync::naming
