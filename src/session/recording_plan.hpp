#pragma once

#include "config/recorder_config.hpp"
#include "naming/device_model.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace recsync::session {

// Devices one session records, in start order.
//
// - standalone: the local camera at `kinect.--device` with role standalone
// - sync: the configured sync master first, then every other `--ip-devices`
//   entry as a subordinate (hosts in lexical order, indices as listed). A
//   master missing from `--ip-devices` is still recorded.
// - both modes: one audio input per `audio.input_device_index` entry
std::vector<naming::DeviceDescriptor> BuildRecordingPlan(const config::RecorderConfig& config,
                                                         naming::RecordingMode mode);

// Value reported as `device_count` in session metadata.
std::size_t CountPlannedDevices(const std::vector<naming::DeviceDescriptor>& plan);

// `camera master 127.0.0.1 0` / `audio 1`
std::string DescribePlannedDevice(const naming::DeviceDescriptor& device);

} // namespace recsync::session
