#include "artifacts/session_manifest_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace recsync::artifacts {

namespace {

using JsonValue = core::json::Value;

const JsonValue* RequireMember(const JsonValue& root, std::string_view key,
                               JsonValue::Type expected, std::string_view expected_text,
                               std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr) {
    error = "session manifest missing required field '" + std::string(key) + "'";
    return nullptr;
  }
  if (value->type != expected) {
    error = "session manifest field '" + std::string(key) + "' must be " +
            std::string(expected_text);
    return nullptr;
  }
  return value;
}

std::string ReadOptionalString(const JsonValue& root, std::string_view key) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr || !value->is_string()) {
    return {};
  }
  return value->string_value;
}

JsonValue ReadOptionalMember(const JsonValue& root, std::string_view key) {
  const JsonValue* value = core::json::FindMember(root, key);
  return value == nullptr ? JsonValue{} : *value;
}

} // namespace

void AttachConfigSnapshot(const config::RecorderConfig& config, SessionManifest& manifest) {
  using core::json::MakeInteger;
  using core::json::MakeObject;
  using core::json::MakeString;

  manifest.recording_config = MakeObject({
      {"mode", MakeString(naming::ToString(manifest.mode))},
      {"duration", MakeInteger(config.recording.duration_s)},
      {"base_output_dir", MakeString(config.recording.base_output_dir.generic_string())},
  });

  const config::KinectSection& kinect = config.kinect;
  JsonValue kinect_snapshot = MakeObject({
      {"--device", MakeInteger(kinect.standalone_device)},
      {"-c", MakeString(kinect.color_resolution)},
      {"-r", MakeInteger(kinect.frame_rate)},
      {"--imu", MakeString(kinect.imu)},
      {"-e", MakeInteger(kinect.exposure)},
      {"device_names", config::ToJsonValue(kinect.device_names)},
  });
  if (manifest.mode == naming::RecordingMode::kSync) {
    kinect_snapshot.object_value["--sync-delay"] = MakeInteger(kinect.sync_delay_us);
    kinect_snapshot.object_value["--ip-devices"] = config::ToJsonValue(kinect.ip_devices);
  }
  manifest.kinect_config = std::move(kinect_snapshot);

  manifest.audio_config = MakeObject({
      {"mode", MakeString(config.audio.mode)},
      {"device_names", config::ToJsonValue(config.audio.device_names)},
  });
}

std::string ToJson(const SessionManifest& manifest) {
  JsonValue files = core::json::MakeArray();
  files.array_value.reserve(manifest.files_created.size());
  for (const auto& filename : manifest.files_created) {
    files.array_value.push_back(core::json::MakeString(filename));
  }

  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\": " << core::QuoteJson(manifest.schema_version) << ",\n"
      << "  \"timestamp\": " << core::QuoteJson(manifest.timestamp) << ",\n"
      << "  \"mode\": " << core::QuoteJson(naming::ToString(manifest.mode)) << ",\n"
      << "  \"session_dir\": " << core::QuoteJson(manifest.session_dir.generic_string()) << ",\n"
      << "  \"created_at_utc\": " << core::QuoteJson(manifest.created_at_utc) << ",\n"
      << "  \"finalized_at_utc\": " << core::QuoteJson(manifest.finalized_at_utc) << ",\n"
      << "  \"total_files\": " << manifest.files_created.size() << ",\n"
      << "  \"files_created\": " << core::ToJsonText(files, 2, 1) << ",\n"
      << "  \"recording_config\": " << core::ToJsonText(manifest.recording_config, 2, 1) << ",\n"
      << "  \"kinect_config\": " << core::ToJsonText(manifest.kinect_config, 2, 1) << ",\n"
      << "  \"audio_config\": " << core::ToJsonText(manifest.audio_config, 2, 1) << ",\n"
      << "  \"metadata\": "
      << core::ToJsonText(core::json::MakeObject(manifest.metadata), 2, 1) << "\n"
      << "}\n";
  return out.str();
}

bool WriteSessionManifestJson(const SessionManifest& manifest, const fs::path& session_dir,
                              fs::path& written_path, std::string& error) {
  if (session_dir.empty()) {
    error = "session directory cannot be empty";
    return false;
  }
  if (manifest.timestamp.empty()) {
    error = "session manifest requires a timestamp";
    return false;
  }

  const fs::path target = session_dir / std::string(kSessionManifestFileName);
  if (!core::WriteTextFileAtomic(target, ToJson(manifest), error)) {
    return false;
  }
  written_path = target;
  return true;
}

bool LoadSessionManifest(const fs::path& path, SessionManifest& manifest, std::string& error) {
  fs::path manifest_path = path;
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    manifest_path = path / std::string(kSessionManifestFileName);
  }

  std::string text;
  if (!core::ReadTextFile(manifest_path, text, error)) {
    return false;
  }

  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid session manifest JSON in '" + manifest_path.string() + "': " + error;
    return false;
  }
  if (!root.is_object()) {
    error = "session manifest root must be a JSON object";
    return false;
  }

  const JsonValue* timestamp =
      RequireMember(root, "timestamp", JsonValue::Type::kString, "a string", error);
  const JsonValue* mode = timestamp == nullptr ? nullptr
                                               : RequireMember(root, "mode",
                                                               JsonValue::Type::kString,
                                                               "a string", error);
  const JsonValue* session_dir = mode == nullptr ? nullptr
                                                 : RequireMember(root, "session_dir",
                                                                 JsonValue::Type::kString,
                                                                 "a string", error);
  const JsonValue* files = session_dir == nullptr ? nullptr
                                                  : RequireMember(root, "files_created",
                                                                  JsonValue::Type::kArray,
                                                                  "an array", error);
  const JsonValue* metadata = files == nullptr ? nullptr
                                               : RequireMember(root, "metadata",
                                                               JsonValue::Type::kObject,
                                                               "an object", error);
  if (metadata == nullptr) {
    return false;
  }

  SessionManifest parsed;
  if (!naming::ParseRecordingMode(mode->string_value, parsed.mode)) {
    error = "session manifest field 'mode' must be 'sync' or 'standalone'";
    return false;
  }
  for (const auto& item : files->array_value) {
    if (!item.is_string()) {
      error = "session manifest field 'files_created' must contain only strings";
      return false;
    }
    parsed.files_created.push_back(item.string_value);
  }

  const std::string schema_version = ReadOptionalString(root, "schema_version");
  if (!schema_version.empty()) {
    parsed.schema_version = schema_version;
  }
  parsed.timestamp = timestamp->string_value;
  parsed.session_dir = session_dir->string_value;
  parsed.metadata = metadata->object_value;
  parsed.created_at_utc = ReadOptionalString(root, "created_at_utc");
  parsed.finalized_at_utc = ReadOptionalString(root, "finalized_at_utc");
  parsed.recording_config = ReadOptionalMember(root, "recording_config");
  parsed.kinect_config = ReadOptionalMember(root, "kinect_config");
  parsed.audio_config = ReadOptionalMember(root, "audio_config");

  manifest = std::move(parsed);
  return true;
}

} // namespace recsync::artifacts
