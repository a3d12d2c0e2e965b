#include "session/recording_plan.hpp"

#include "naming/device_name_resolver.hpp"

#include <cstdint>
#include <string_view>
#include <utility>

namespace recsync::session {

namespace {

naming::DeviceDescriptor MakeCamera(naming::CaptureRole role, std::string host,
                                    std::uint32_t index) {
  return naming::DeviceDescriptor{
      .device_class = naming::DeviceClass::kCamera,
      .role = role,
      .host_identifier = std::move(host),
      .device_index = index,
  };
}

} // namespace

std::vector<naming::DeviceDescriptor> BuildRecordingPlan(const config::RecorderConfig& config,
                                                         const naming::RecordingMode mode) {
  std::vector<naming::DeviceDescriptor> plan;
  const config::KinectSection& kinect = config.kinect;

  if (mode == naming::RecordingMode::kStandalone) {
    plan.push_back(MakeCamera(naming::CaptureRole::kStandalone,
                              std::string(naming::kLocalHostBucket), kinect.standalone_device));
  } else {
    plan.push_back(MakeCamera(naming::CaptureRole::kMaster, kinect.sync_master.host,
                              kinect.sync_master.index));
    for (const auto& [host, indices] : kinect.ip_devices) {
      for (const std::uint32_t index : indices) {
        if (host == kinect.sync_master.host && index == kinect.sync_master.index) {
          continue;
        }
        plan.push_back(MakeCamera(naming::CaptureRole::kSubordinate, host, index));
      }
    }
  }

  for (const std::uint32_t index : config.audio.input_device_index) {
    plan.push_back(naming::DeviceDescriptor{
        .device_class = naming::DeviceClass::kAudio,
        .role = naming::CaptureRole::kStandalone,
        .host_identifier = {},
        .device_index = index,
    });
  }
  return plan;
}

std::size_t CountPlannedDevices(const std::vector<naming::DeviceDescriptor>& plan) {
  return plan.size();
}

std::string DescribePlannedDevice(const naming::DeviceDescriptor& device) {
  std::string text = naming::ToString(device.device_class);
  if (device.device_class == naming::DeviceClass::kCamera) {
    text += ' ';
    text += naming::ToString(device.role);
    text += ' ';
    text += device.host_identifier.empty() ? std::string(naming::kLocalHostBucket)
                                           : device.host_identifier;
  }
  text += ' ';
  text += std::to_string(device.device_index);
  return text;
}

} // namespace recsync::session
