#pragma once

#include "core/json_dom.hpp"
#include "naming/device_model.hpp"
#include "naming/naming_config.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace recsync::config {

// What cleanup does with registered files when a session is aborted.
enum class CleanupPolicy {
  kMarkAborted = 0,
  kRemoveTracked,
};

const char* ToString(CleanupPolicy policy);
bool ParseCleanupPolicy(std::string_view text, CleanupPolicy& policy);

// Camera that drives the sync group; every other `--ip-devices` entry records
// as a subordinate.
struct SyncMasterSelector {
  std::string host = "127.0.0.1";
  std::uint32_t index = 0;

  bool operator==(const SyncMasterSelector& other) const = default;
};

// `recording` section: system-wide session settings.
struct RecordingSection {
  naming::RecordingMode mode = naming::RecordingMode::kSync;
  std::int64_t duration_s = 10;
  double standalone_delay_s = 0.0;
  double sync_delay_s = 0.86;
  bool is_local_debug = true;
  std::filesystem::path base_output_dir = "recordings";
  std::string timestamp_format = "%Y-%m-%d_%H-%M-%S";
  CleanupPolicy cleanup_policy = CleanupPolicy::kMarkAborted;

  bool operator==(const RecordingSection& other) const = default;
};

// `kinect` section. Option keys keep the recorder CLI spelling (`--device`,
// `-c`, `--ip-devices`, ...) because the same file feeds the capture wrappers.
struct KinectSection {
  std::uint32_t standalone_device = 1;
  std::string color_resolution = "720p";
  std::string depth_mode = "NFOV_UNBINNED";
  std::int64_t frame_rate = 15;
  std::string imu = "OFF";
  std::int64_t exposure = 1;
  std::int64_t sync_delay_us = 200;
  std::map<std::string, std::vector<std::uint32_t>> ip_devices;
  SyncMasterSelector sync_master;
  std::map<std::string, naming::IndexNameTable> device_names;

  bool operator==(const KinectSection& other) const = default;
};

// `audio` section.
struct AudioSection {
  std::string mode = "timing";
  std::vector<std::uint32_t> input_device_index{1};
  naming::IndexNameTable device_names;

  bool operator==(const AudioSection& other) const = default;
};

struct RecorderConfig {
  RecordingSection recording;
  KinectSection kinect;
  AudioSection audio;

  bool operator==(const RecorderConfig& other) const = default;
};

// Built-in defaults, also written out by LoadOrCreateRecorderConfig.
RecorderConfig DefaultRecorderConfig();

// Parses config JSON and overlays it on DefaultRecorderConfig(): keys present
// in the text win, absent keys keep their defaults, and the per-host
// `device_names`/`--ip-devices` tables merge entry by entry. Unknown keys are
// ignored. Returns false with a field-qualified message on invalid JSON, a
// non-object root, or a known key with an unusable value.
bool ParseRecorderConfigText(std::string_view json_text, RecorderConfig& config,
                             std::string& error);

bool LoadRecorderConfigFile(const std::filesystem::path& config_path, RecorderConfig& config,
                            std::string& error);

// Loads `config_path`, or writes the defaults there when it does not exist
// yet. `created` reports which of the two happened.
bool LoadOrCreateRecorderConfig(const std::filesystem::path& config_path, RecorderConfig& config,
                                bool& created, std::string& error);

// Pretty-printed JSON document in the on-disk layout.
std::string ToJson(const RecorderConfig& config);

// DOM forms of the name/device tables, shared with the session manifest
// snapshot so both documents spell them identically.
core::json::Value ToJsonValue(const naming::IndexNameTable& names);
core::json::Value ToJsonValue(const std::map<std::string, naming::IndexNameTable>& names);
core::json::Value ToJsonValue(const std::map<std::string, std::vector<std::uint32_t>>& devices);

// Naming snapshot handed to the session manager.
naming::NamingConfiguration MakeNamingConfiguration(const RecorderConfig& config);

} // namespace recsync::config
