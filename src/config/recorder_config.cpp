#include "config/recorder_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace recsync::config {

namespace {

using JsonValue = core::json::Value;
using JsonObject = JsonValue::Object;

std::string FieldPath(std::string_view section, std::string_view key) {
  return std::string(section) + "." + std::string(key);
}

bool ParseIndexText(std::string_view text, std::uint32_t& index) {
  if (text.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
  return ec == std::errc() && ptr == text.data() + text.size();
}

bool ReadIndexValue(const JsonValue& value, std::uint32_t& index) {
  if (!value.is_integer() || value.integer_value < 0 ||
      value.integer_value > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
    return false;
  }
  index = static_cast<std::uint32_t>(value.integer_value);
  return true;
}

bool ReadString(const JsonValue& section, std::string_view section_name, std::string_view key,
                std::string& target, std::string& error) {
  const JsonValue* value = core::json::FindMember(section, key);
  if (value == nullptr) {
    return true;
  }
  if (!value->is_string()) {
    error = "config field '" + FieldPath(section_name, key) + "' must be a string";
    return false;
  }
  target = value->string_value;
  return true;
}

bool ReadInteger(const JsonValue& section, std::string_view section_name, std::string_view key,
                 std::int64_t& target, std::string& error) {
  const JsonValue* value = core::json::FindMember(section, key);
  if (value == nullptr) {
    return true;
  }
  if (!value->is_integer()) {
    error = "config field '" + FieldPath(section_name, key) + "' must be an integer";
    return false;
  }
  target = value->integer_value;
  return true;
}

bool ReadNonNegativeNumber(const JsonValue& section, std::string_view section_name,
                           std::string_view key, double& target, std::string& error) {
  const JsonValue* value = core::json::FindMember(section, key);
  if (value == nullptr) {
    return true;
  }
  if (!value->is_number() || !std::isfinite(value->AsDouble()) || value->AsDouble() < 0.0) {
    error = "config field '" + FieldPath(section_name, key) + "' must be a non-negative number";
    return false;
  }
  target = value->AsDouble();
  return true;
}

bool ReadBool(const JsonValue& section, std::string_view section_name, std::string_view key,
              bool& target, std::string& error) {
  const JsonValue* value = core::json::FindMember(section, key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kBool) {
    error = "config field '" + FieldPath(section_name, key) + "' must be a boolean";
    return false;
  }
  target = value->bool_value;
  return true;
}

bool ReadIndex(const JsonValue& section, std::string_view section_name, std::string_view key,
               std::uint32_t& target, std::string& error) {
  const JsonValue* value = core::json::FindMember(section, key);
  if (value == nullptr) {
    return true;
  }
  if (!ReadIndexValue(*value, target)) {
    error = "config field '" + FieldPath(section_name, key) +
            "' must be a non-negative integer device index";
    return false;
  }
  return true;
}

bool ReadIndexList(const JsonValue& value, std::string_view field, std::vector<std::uint32_t>& out,
                   std::string& error) {
  if (!value.is_array()) {
    error = "config field '" + std::string(field) + "' must be an array of device indices";
    return false;
  }
  std::vector<std::uint32_t> parsed;
  parsed.reserve(value.array_value.size());
  for (const auto& item : value.array_value) {
    std::uint32_t index = 0;
    if (!ReadIndexValue(item, index)) {
      error = "config field '" + std::string(field) + "' must contain non-negative integers";
      return false;
    }
    parsed.push_back(index);
  }
  out = std::move(parsed);
  return true;
}

// Friendly names end up inside filenames, so they must be non-empty and free of
// path separators.
bool ValidateFriendlyName(std::string_view name, std::string_view field, std::string& error) {
  if (name.empty()) {
    error = "config field '" + std::string(field) + "' must not be an empty name";
    return false;
  }
  if (name.find_first_of("/\\") != std::string_view::npos) {
    error = "config field '" + std::string(field) + "' must not contain path separators";
    return false;
  }
  return true;
}

// Merges `{"<index>": "<name>", ...}` into `table`, entry by entry.
bool MergeIndexNameTable(const JsonValue& value, std::string_view field,
                         naming::IndexNameTable& table, std::string& error) {
  if (!value.is_object()) {
    error = "config field '" + std::string(field) + "' must be an object of index -> name";
    return false;
  }
  for (const auto& [key, name] : value.object_value) {
    const std::string entry_field = std::string(field) + "." + key;
    std::uint32_t index = 0;
    if (!ParseIndexText(key, index)) {
      error = "config field '" + entry_field + "' key must be a non-negative integer";
      return false;
    }
    if (!name.is_string()) {
      error = "config field '" + entry_field + "' must be a string";
      return false;
    }
    if (!ValidateFriendlyName(name.string_value, entry_field, error)) {
      return false;
    }
    table[index] = name.string_value;
  }
  return true;
}

bool ParseRecordingSection(const JsonValue& section, RecordingSection& recording,
                           std::string& error) {
  constexpr std::string_view kName = "recording";
  if (!section.is_object()) {
    error = "config section 'recording' must be an object";
    return false;
  }

  std::string mode_text = naming::ToString(recording.mode);
  if (!ReadString(section, kName, "mode", mode_text, error)) {
    return false;
  }
  if (!naming::ParseRecordingMode(mode_text, recording.mode)) {
    error = "config field 'recording.mode' must be 'sync' or 'standalone' (got '" + mode_text +
            "')";
    return false;
  }

  if (!ReadInteger(section, kName, "duration", recording.duration_s, error)) {
    return false;
  }
  if (recording.duration_s <= 0) {
    error = "config field 'recording.duration' must be a positive number of seconds";
    return false;
  }
  if (!ReadNonNegativeNumber(section, kName, "standalone_delay", recording.standalone_delay_s,
                             error) ||
      !ReadNonNegativeNumber(section, kName, "sync_delay", recording.sync_delay_s, error) ||
      !ReadBool(section, kName, "is_local_debug", recording.is_local_debug, error)) {
    return false;
  }

  std::string base_dir = recording.base_output_dir.string();
  if (!ReadString(section, kName, "base_output_dir", base_dir, error)) {
    return false;
  }
  if (base_dir.empty()) {
    error = "config field 'recording.base_output_dir' must not be empty";
    return false;
  }
  recording.base_output_dir = base_dir;

  if (!ReadString(section, kName, "timestamp_format", recording.timestamp_format, error)) {
    return false;
  }
  if (recording.timestamp_format.empty()) {
    error = "config field 'recording.timestamp_format' must not be empty";
    return false;
  }

  std::string policy_text = ToString(recording.cleanup_policy);
  if (!ReadString(section, kName, "cleanup_policy", policy_text, error)) {
    return false;
  }
  if (!ParseCleanupPolicy(policy_text, recording.cleanup_policy)) {
    error = "config field 'recording.cleanup_policy' must be 'mark_aborted' or "
            "'remove_tracked' (got '" +
            policy_text + "')";
    return false;
  }
  return true;
}

bool ParseKinectSection(const JsonValue& section, KinectSection& kinect, std::string& error) {
  constexpr std::string_view kName = "kinect";
  if (!section.is_object()) {
    error = "config section 'kinect' must be an object";
    return false;
  }

  if (!ReadIndex(section, kName, "--device", kinect.standalone_device, error) ||
      !ReadString(section, kName, "-c", kinect.color_resolution, error) ||
      !ReadString(section, kName, "-d", kinect.depth_mode, error) ||
      !ReadInteger(section, kName, "-r", kinect.frame_rate, error) ||
      !ReadString(section, kName, "--imu", kinect.imu, error) ||
      !ReadInteger(section, kName, "-e", kinect.exposure, error) ||
      !ReadInteger(section, kName, "--sync-delay", kinect.sync_delay_us, error)) {
    return false;
  }

  if (const JsonValue* ip_devices = core::json::FindMember(section, "--ip-devices");
      ip_devices != nullptr) {
    if (!ip_devices->is_object()) {
      error = "config field 'kinect.--ip-devices' must be an object of host -> [indices]";
      return false;
    }
    for (const auto& [host, indices] : ip_devices->object_value) {
      if (host.empty()) {
        error = "config field 'kinect.--ip-devices' must not contain an empty host";
        return false;
      }
      if (!ReadIndexList(indices, "kinect.--ip-devices." + host, kinect.ip_devices[host],
                         error)) {
        return false;
      }
    }
  }

  if (const JsonValue* master = core::json::FindMember(section, "sync_master");
      master != nullptr) {
    if (!master->is_object()) {
      error = "config field 'kinect.sync_master' must be an object with host and index";
      return false;
    }
    if (!ReadString(*master, "kinect.sync_master", "host", kinect.sync_master.host, error) ||
        !ReadIndex(*master, "kinect.sync_master", "index", kinect.sync_master.index, error)) {
      return false;
    }
  }

  if (const JsonValue* names = core::json::FindMember(section, "device_names");
      names != nullptr) {
    if (!names->is_object()) {
      error = "config field 'kinect.device_names' must be an object of host -> {index: name}";
      return false;
    }
    for (const auto& [host, table] : names->object_value) {
      if (!MergeIndexNameTable(table, "kinect.device_names." + host, kinect.device_names[host],
                               error)) {
        return false;
      }
    }
  }
  return true;
}

bool ParseAudioSection(const JsonValue& section, AudioSection& audio, std::string& error) {
  constexpr std::string_view kName = "audio";
  if (!section.is_object()) {
    error = "config section 'audio' must be an object";
    return false;
  }
  if (!ReadString(section, kName, "mode", audio.mode, error)) {
    return false;
  }
  if (const JsonValue* inputs = core::json::FindMember(section, "input_device_index");
      inputs != nullptr) {
    if (!ReadIndexList(*inputs, "audio.input_device_index", audio.input_device_index, error)) {
      return false;
    }
  }
  if (const JsonValue* names = core::json::FindMember(section, "device_names");
      names != nullptr) {
    if (!MergeIndexNameTable(*names, "audio.device_names", audio.device_names, error)) {
      return false;
    }
  }
  return true;
}

JsonValue ToJsonValue(const std::vector<std::uint32_t>& indices) {
  JsonValue array = core::json::MakeArray();
  array.array_value.reserve(indices.size());
  for (const std::uint32_t index : indices) {
    array.array_value.push_back(core::json::MakeInteger(index));
  }
  return array;
}

} // namespace

const char* ToString(const CleanupPolicy policy) {
  switch (policy) {
  case CleanupPolicy::kMarkAborted:
    return "mark_aborted";
  case CleanupPolicy::kRemoveTracked:
    return "remove_tracked";
  }
  return "mark_aborted";
}

bool ParseCleanupPolicy(std::string_view text, CleanupPolicy& policy) {
  if (text == "mark_aborted") {
    policy = CleanupPolicy::kMarkAborted;
    return true;
  }
  if (text == "remove_tracked") {
    policy = CleanupPolicy::kRemoveTracked;
    return true;
  }
  return false;
}

RecorderConfig DefaultRecorderConfig() {
  RecorderConfig config;
  config.kinect.ip_devices = {{"127.0.0.1", {0, 2, 3}}};
  config.kinect.device_names = {
      {"127.0.0.1", {{0, "master_cam"}, {2, "left_cam"}, {3, "right_cam"}}},
      {"local", {{1, "standalone_cam"}}},
  };
  config.audio.device_names = {{1, "main_mic"}, {5, "backup_mic"}, {6, "wireless_mic"}};
  return config;
}

bool ParseRecorderConfigText(std::string_view json_text, RecorderConfig& config,
                             std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid config JSON: " + error;
    return false;
  }
  if (!root.is_object()) {
    error = "config root must be a JSON object";
    return false;
  }

  RecorderConfig parsed = DefaultRecorderConfig();
  if (const JsonValue* section = core::json::FindMember(root, "recording"); section != nullptr) {
    if (!ParseRecordingSection(*section, parsed.recording, error)) {
      return false;
    }
  }
  if (const JsonValue* section = core::json::FindMember(root, "kinect"); section != nullptr) {
    if (!ParseKinectSection(*section, parsed.kinect, error)) {
      return false;
    }
  }
  if (const JsonValue* section = core::json::FindMember(root, "audio"); section != nullptr) {
    if (!ParseAudioSection(*section, parsed.audio, error)) {
      return false;
    }
  }

  config = std::move(parsed);
  return true;
}

bool LoadRecorderConfigFile(const fs::path& config_path, RecorderConfig& config,
                            std::string& error) {
  std::string text;
  if (!core::ReadTextFile(config_path, text, error)) {
    return false;
  }
  if (!ParseRecorderConfigText(text, config, error)) {
    error = config_path.string() + ": " + error;
    return false;
  }
  return true;
}

bool LoadOrCreateRecorderConfig(const fs::path& config_path, RecorderConfig& config,
                                bool& created, std::string& error) {
  created = false;
  std::error_code ec;
  const bool exists = fs::exists(config_path, ec);
  if (ec) {
    error = "failed to stat config file '" + config_path.string() + "': " + ec.message();
    return false;
  }
  if (exists) {
    return LoadRecorderConfigFile(config_path, config, error);
  }

  const RecorderConfig defaults = DefaultRecorderConfig();
  if (!core::WriteTextFileAtomic(config_path, ToJson(defaults), error)) {
    return false;
  }
  config = defaults;
  created = true;
  return true;
}

JsonValue ToJsonValue(const naming::IndexNameTable& names) {
  JsonValue object = core::json::MakeObject();
  for (const auto& [index, name] : names) {
    object.object_value[std::to_string(index)] = core::json::MakeString(name);
  }
  return object;
}

JsonValue ToJsonValue(const std::map<std::string, naming::IndexNameTable>& names) {
  JsonValue object = core::json::MakeObject();
  for (const auto& [host, table] : names) {
    object.object_value[host] = ToJsonValue(table);
  }
  return object;
}

JsonValue ToJsonValue(const std::map<std::string, std::vector<std::uint32_t>>& devices) {
  JsonValue object = core::json::MakeObject();
  for (const auto& [host, indices] : devices) {
    object.object_value[host] = ToJsonValue(indices);
  }
  return object;
}

std::string ToJson(const RecorderConfig& config) {
  using core::json::MakeBool;
  using core::json::MakeInteger;
  using core::json::MakeNumber;
  using core::json::MakeObject;
  using core::json::MakeString;

  const RecordingSection& rec = config.recording;
  const KinectSection& kinect = config.kinect;
  const AudioSection& audio = config.audio;

  JsonValue root = MakeObject({
      {"recording", MakeObject({
                        {"mode", MakeString(naming::ToString(rec.mode))},
                        {"duration", MakeInteger(rec.duration_s)},
                        {"standalone_delay", MakeNumber(rec.standalone_delay_s)},
                        {"sync_delay", MakeNumber(rec.sync_delay_s)},
                        {"is_local_debug", MakeBool(rec.is_local_debug)},
                        {"base_output_dir", MakeString(rec.base_output_dir.generic_string())},
                        {"timestamp_format", MakeString(rec.timestamp_format)},
                        {"cleanup_policy", MakeString(ToString(rec.cleanup_policy))},
                    })},
      {"kinect", MakeObject({
                     {"--device", MakeInteger(kinect.standalone_device)},
                     {"-c", MakeString(kinect.color_resolution)},
                     {"-d", MakeString(kinect.depth_mode)},
                     {"-r", MakeInteger(kinect.frame_rate)},
                     {"--imu", MakeString(kinect.imu)},
                     {"-e", MakeInteger(kinect.exposure)},
                     {"--sync-delay", MakeInteger(kinect.sync_delay_us)},
                     {"--ip-devices", ToJsonValue(kinect.ip_devices)},
                     {"sync_master", MakeObject({
                                         {"host", MakeString(kinect.sync_master.host)},
                                         {"index", MakeInteger(kinect.sync_master.index)},
                                     })},
                     {"device_names", ToJsonValue(kinect.device_names)},
                 })},
      {"audio", MakeObject({
                    {"mode", MakeString(audio.mode)},
                    {"input_device_index", ToJsonValue(audio.input_device_index)},
                    {"device_names", ToJsonValue(audio.device_names)},
                })},
  });
  return core::ToJsonText(root, 2) + "\n";
}

naming::NamingConfiguration MakeNamingConfiguration(const RecorderConfig& config) {
  naming::NamingConfiguration naming;
  naming.camera_names = config.kinect.device_names;
  naming.audio_names = config.audio.device_names;
  naming.base_output_dir = config.recording.base_output_dir;
  naming.timestamp_format = config.recording.timestamp_format;
  naming.default_mode = config.recording.mode;
  return naming;
}

} // namespace recsync::config
