#include "naming/filename_generator.hpp"

#include "naming/device_name_resolver.hpp"

namespace recsync::naming {

std::string_view RoleTag(const CaptureRole role) {
  switch (role) {
  case CaptureRole::kMaster:
    return "master";
  case CaptureRole::kSubordinate:
    return "sub";
  case CaptureRole::kStandalone:
    return "standalone";
  }
  return "standalone";
}

std::string ComposeKinectFilename(std::string_view timestamp, const CaptureRole role,
                                  std::string_view friendly_name) {
  std::string filename;
  filename.reserve(timestamp.size() + friendly_name.size() + 24);
  filename.append(timestamp);
  filename.push_back('-');
  filename.append(RoleTag(role));
  filename.push_back('-');
  filename.append(friendly_name);
  filename.push_back('.');
  filename.append(kCameraContainerExtension);
  return filename;
}

std::string ComposeAudioFilename(std::string_view timestamp, std::string_view friendly_name) {
  std::string filename;
  filename.reserve(timestamp.size() + friendly_name.size() + 8);
  filename.append(timestamp);
  filename.push_back('-');
  filename.append(friendly_name);
  filename.push_back('.');
  filename.append(kAudioExtension);
  return filename;
}

std::string FilenameGenerator::KinectFilename(const CaptureRole role,
                                              std::string_view host_identifier,
                                              const std::uint32_t device_index) const {
  const std::string friendly =
      ResolveFriendlyName(DeviceClass::kCamera, host_identifier, device_index, naming_);
  return ComposeKinectFilename(timestamp_, role, friendly);
}

std::string FilenameGenerator::AudioFilename(const std::uint32_t device_index) const {
  const std::string friendly =
      ResolveFriendlyName(DeviceClass::kAudio, kLocalHostBucket, device_index, naming_);
  return ComposeAudioFilename(timestamp_, friendly);
}

std::string FilenameGenerator::FilenameFor(const DeviceDescriptor& device) const {
  if (device.device_class == DeviceClass::kAudio) {
    return AudioFilename(device.device_index);
  }
  return KinectFilename(device.role, device.host_identifier, device.device_index);
}

} // namespace recsync::naming
