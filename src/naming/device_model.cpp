#include "naming/device_model.hpp"

namespace recsync::naming {

const char* ToString(const DeviceClass device_class) {
  switch (device_class) {
  case DeviceClass::kCamera:
    return "camera";
  case DeviceClass::kAudio:
    return "audio";
  }
  return "camera";
}

const char* ToString(const CaptureRole role) {
  switch (role) {
  case CaptureRole::kMaster:
    return "master";
  case CaptureRole::kSubordinate:
    return "subordinate";
  case CaptureRole::kStandalone:
    return "standalone";
  }
  return "standalone";
}

const char* ToString(const RecordingMode mode) {
  switch (mode) {
  case RecordingMode::kStandalone:
    return "standalone";
  case RecordingMode::kSync:
    return "sync";
  }
  return "sync";
}

bool ParseDeviceClass(std::string_view text, DeviceClass& device_class) {
  if (text == "camera" || text == "kinect") {
    device_class = DeviceClass::kCamera;
    return true;
  }
  if (text == "audio") {
    device_class = DeviceClass::kAudio;
    return true;
  }
  return false;
}

bool ParseCaptureRole(std::string_view text, CaptureRole& role) {
  if (text == "master") {
    role = CaptureRole::kMaster;
    return true;
  }
  if (text == "subordinate" || text == "sub") {
    role = CaptureRole::kSubordinate;
    return true;
  }
  if (text == "standalone") {
    role = CaptureRole::kStandalone;
    return true;
  }
  return false;
}

bool ParseRecordingMode(std::string_view text, RecordingMode& mode) {
  if (text == "sync") {
    mode = RecordingMode::kSync;
    return true;
  }
  if (text == "standalone") {
    mode = RecordingMode::kStandalone;
    return true;
  }
  return false;
}

} // namespace recsync::naming
