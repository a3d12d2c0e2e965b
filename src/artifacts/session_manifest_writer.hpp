#pragma once

#include "config/recorder_config.hpp"
#include "core/json_dom.hpp"
#include "naming/device_model.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace recsync::artifacts {

inline constexpr std::string_view kSessionManifestFileName = "session_info.json";
inline constexpr std::string_view kSessionManifestSchemaVersion = "1.0";

// Durable record of one finalized session. Playback and audit tooling depend
// on this layout; bump `schema_version` on any incompatible change.
//
// The three `*_config` members are DOM snapshots of the configuration the
// session ran with (null when not attached).
struct SessionManifest {
  std::string schema_version = std::string(kSessionManifestSchemaVersion);
  std::string timestamp;
  naming::RecordingMode mode = naming::RecordingMode::kSync;
  std::filesystem::path session_dir;
  std::vector<std::string> files_created;
  core::json::Value::Object metadata;
  std::string created_at_utc;
  std::string finalized_at_utc;
  core::json::Value recording_config;
  core::json::Value kinect_config;
  core::json::Value audio_config;
};

// Fills the config snapshot members. Sync-only camera options (`--sync-delay`,
// `--ip-devices`) are included only for sync sessions.
void AttachConfigSnapshot(const config::RecorderConfig& config, SessionManifest& manifest);

// Pretty-printed manifest document with a fixed top-level key order:
// schema_version, timestamp, mode, session_dir, created_at_utc,
// finalized_at_utc, total_files, files_created, recording_config,
// kinect_config, audio_config, metadata.
std::string ToJson(const SessionManifest& manifest);

// Writes `<session_dir>/session_info.json` through a temp file + rename, so a
// reader never sees a half-written manifest.
//
// Contract:
// - Returns true on success and populates `written_path`.
// - Returns false on failure and populates `error`; any previous manifest at
//   the destination is left untouched.
bool WriteSessionManifestJson(const SessionManifest& manifest,
                              const std::filesystem::path& session_dir,
                              std::filesystem::path& written_path, std::string& error);

// Reads a manifest back. `path` may name the manifest file or the session
// directory that holds it. Requires timestamp, mode, session_dir,
// files_created and metadata.
bool LoadSessionManifest(const std::filesystem::path& path, SessionManifest& manifest,
                         std::string& error);

} // namespace recsync::artifacts
