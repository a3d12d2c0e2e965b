#pragma once

#include "naming/device_model.hpp"
#include "naming/naming_config.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace recsync::naming {

// Reserved camera-name bucket for devices on the coordinating machine.
inline constexpr std::string_view kLocalHostBucket = "local";

// True for the markers that mean "this machine": empty, `local`, `localhost`,
// any 127.0.0.0/8 address and `::1`.
bool IsLocalHostMarker(std::string_view host_identifier);

// Deterministic synthetic name used when no mapping entry exists:
// - camera on a local host:  `camera_cam<index>`
// - camera on a remote host: `camera_cam<index>_<host>` (host reduced to
//   filename-safe characters)
// - audio:                   `audio<index>`
// Never empty; two devices of the same class and host never share a fallback
// name unless their indices match.
std::string BuildFallbackName(DeviceClass device_class, std::string_view host_identifier,
                              std::uint32_t device_index);

// Resolves the friendly name for a device. Total: always returns a name.
//
// Lookup order:
// 1) camera: exact `(host, index)` entry in `camera_names`
// 2) camera on a local marker: `local` bucket entry for `index`
// 3) audio: `audio_names` entry for `index` (host ignored)
// 4) BuildFallbackName
std::string ResolveFriendlyName(DeviceClass device_class, std::string_view host_identifier,
                                std::uint32_t device_index, const NamingConfiguration& config);

std::string ResolveFriendlyName(const DeviceDescriptor& device, const NamingConfiguration& config);

} // namespace recsync::naming
