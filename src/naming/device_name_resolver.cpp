#include "naming/device_name_resolver.hpp"

#include <cctype>

namespace recsync::naming {

namespace {

const std::string* FindName(const IndexNameTable& table, std::uint32_t device_index) {
  const auto it = table.find(device_index);
  if (it == table.end() || it->second.empty()) {
    return nullptr;
  }
  return &it->second;
}

const std::string* FindCameraName(const NamingConfiguration& config, std::string_view host,
                                  std::uint32_t device_index) {
  const auto host_it = config.camera_names.find(std::string(host));
  if (host_it == config.camera_names.end()) {
    return nullptr;
  }
  return FindName(host_it->second, device_index);
}

// Keeps letters, digits, '.', '-' and '_'; everything else (':' in IPv6
// addresses, path separators) becomes '-'.
std::string SanitizeHostForFilename(std::string_view host) {
  std::string sanitized;
  sanitized.reserve(host.size());
  for (const char c : host) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0 || c == '.' || c == '-' || c == '_') {
      sanitized.push_back(c);
    } else {
      sanitized.push_back('-');
    }
  }
  return sanitized;
}

} // namespace

bool IsLocalHostMarker(std::string_view host_identifier) {
  return host_identifier.empty() || host_identifier == kLocalHostBucket ||
         host_identifier == "localhost" || host_identifier == "::1" ||
         host_identifier.rfind("127.", 0) == 0U;
}

std::string BuildFallbackName(DeviceClass device_class, std::string_view host_identifier,
                              std::uint32_t device_index) {
  const std::string index_text = std::to_string(device_index);
  if (device_class == DeviceClass::kAudio) {
    return std::string(ToString(device_class)) + index_text;
  }

  std::string name = std::string(ToString(device_class)) + "_cam" + index_text;
  if (!IsLocalHostMarker(host_identifier)) {
    name += "_" + SanitizeHostForFilename(host_identifier);
  }
  return name;
}

std::string ResolveFriendlyName(DeviceClass device_class, std::string_view host_identifier,
                                std::uint32_t device_index, const NamingConfiguration& config) {
  if (device_class == DeviceClass::kAudio) {
    if (const std::string* name = FindName(config.audio_names, device_index); name != nullptr) {
      return *name;
    }
    return BuildFallbackName(device_class, host_identifier, device_index);
  }

  if (const std::string* name = FindCameraName(config, host_identifier, device_index);
      name != nullptr) {
    return *name;
  }
  if (IsLocalHostMarker(host_identifier)) {
    if (const std::string* name = FindCameraName(config, kLocalHostBucket, device_index);
        name != nullptr) {
      return *name;
    }
  }
  return BuildFallbackName(device_class, host_identifier, device_index);
}

std::string ResolveFriendlyName(const DeviceDescriptor& device, const NamingConfiguration& config) {
  return ResolveFriendlyName(device.device_class, device.host_identifier, device.device_index,
                             config);
}

} // namespace recsync::naming
