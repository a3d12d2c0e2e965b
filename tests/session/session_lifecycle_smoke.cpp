#include "artifacts/session_manifest_writer.hpp"
#include "core/json_dom.hpp"
#include "session/session_manager.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

using recsync::session::CreateSessionOptions;
using recsync::session::SessionError;
using recsync::session::SessionErrorCode;
using recsync::session::SessionInfo;
using recsync::session::SessionManager;
using recsync::tests::common::AssertContains;
using recsync::tests::common::Fail;

namespace {

constexpr std::string_view kTimestamp = "2025-08-14_15-30-45";

CreateSessionOptions SyncAt(std::string_view timestamp) {
  CreateSessionOptions options;
  options.custom_timestamp = std::string(timestamp);
  options.mode_override = recsync::naming::RecordingMode::kSync;
  return options;
}

void ExpectCode(const SessionError& error, SessionErrorCode expected, std::string_view context) {
  if (error.code != expected) {
    Fail(std::string(context) + ": expected " +
         std::string(recsync::session::ToStableErrorCode(expected)) + ", got '" +
         recsync::session::FormatSessionError(error) + "'");
  }
}

void ExpectNoSessionErrors(SessionManager& manager, std::string_view context) {
  SessionError error;
  std::string filename;
  if (manager.RegisterFile("late.mkv", error)) {
    Fail(std::string(context) + ": RegisterFile succeeded without a session");
  }
  ExpectCode(error, SessionErrorCode::kInvalidState, context);
  AssertContains(error.message, "no active recording session");

  if (manager.GenerateKinectFilename(recsync::naming::CaptureRole::kMaster, "127.0.0.1", 0,
                                     filename, error)) {
    Fail(std::string(context) + ": GenerateKinectFilename succeeded without a session");
  }
  ExpectCode(error, SessionErrorCode::kInvalidState, context);

  if (manager.GenerateAudioFilename(1, filename, error)) {
    Fail(std::string(context) + ": GenerateAudioFilename succeeded without a session");
  }
  ExpectCode(error, SessionErrorCode::kInvalidState, context);

  fs::path manifest_path;
  if (manager.Finalize({}, manifest_path, error)) {
    Fail(std::string(context) + ": Finalize succeeded without a session");
  }
  ExpectCode(error, SessionErrorCode::kInvalidState, context);

  if (manager.GetCurrentSessionInfo().has_value()) {
    Fail(std::string(context) + ": GetCurrentSessionInfo returned a session");
  }
}

} // namespace

int main() {
  const fs::path root = recsync::tests::common::CreateUniqueTempDir("recsync-session-lifecycle");

  recsync::config::RecorderConfig config = recsync::config::DefaultRecorderConfig();
  config.recording.base_output_dir = root / "recordings";

  std::ostringstream log_stream;
  recsync::core::logging::Logger logger(recsync::core::logging::LogLevel::kDebug, log_stream);
  SessionManager manager(config, &logger);

  ExpectNoSessionErrors(manager, "before create");

  SessionInfo info;
  SessionError error;
  if (!manager.CreateSession(SyncAt(kTimestamp), info, error)) {
    Fail("CreateSession failed: " + recsync::session::FormatSessionError(error));
  }
  const fs::path expected_dir = root / "recordings" / "sync" / std::string(kTimestamp);
  if (info.session_dir != expected_dir || !fs::is_directory(expected_dir)) {
    Fail("session directory not created at " + expected_dir.string());
  }
  if (info.timestamp != kTimestamp || info.mode != recsync::naming::RecordingMode::kSync) {
    Fail("session info does not echo the requested timestamp/mode");
  }
  if (logger.SessionId() != kTimestamp) {
    Fail("logger session id not set to the session timestamp");
  }

  SessionInfo second;
  if (manager.CreateSession(SyncAt("2025-08-14_16-00-00"), second, error)) {
    Fail("second CreateSession succeeded while a session was active");
  }
  ExpectCode(error, SessionErrorCode::kAlreadyActive, "second create");
  AssertContains(error.message, "already active");
  if (fs::exists(root / "recordings" / "sync" / "2025-08-14_16-00-00")) {
    Fail("rejected CreateSession left a directory behind");
  }

  std::string master_name;
  std::string left_name;
  std::string mic_name;
  if (!manager.GenerateKinectFilename(recsync::naming::CaptureRole::kMaster, "127.0.0.1", 0,
                                      master_name, error) ||
      !manager.GenerateKinectFilename(recsync::naming::CaptureRole::kSubordinate, "127.0.0.1", 2,
                                      left_name, error) ||
      !manager.GenerateAudioFilename(1, mic_name, error)) {
    Fail("filename generation failed: " + recsync::session::FormatSessionError(error));
  }
  recsync::tests::common::AssertEqual(master_name, "2025-08-14_15-30-45-master-master_cam.mkv",
                                      "master filename");
  recsync::tests::common::AssertEqual(left_name, "2025-08-14_15-30-45-sub-left_cam.mkv",
                                      "subordinate filename");
  recsync::tests::common::AssertEqual(mic_name, "2025-08-14_15-30-45-main_mic.wav",
                                      "audio filename");

  // Generating does not register.
  if (!manager.GetCurrentSessionInfo()->files_created.empty()) {
    Fail("filename generation registered files");
  }

  std::map<std::string, fs::path> kinect_paths;
  if (!manager.KinectOutputPaths(recsync::naming::CaptureRole::kSubordinate, kinect_paths,
                                 error) ||
      kinect_paths.size() != 1U || kinect_paths.at("sync") != expected_dir) {
    Fail("KinectOutputPaths did not return the sync directory");
  }
  fs::path audio_path;
  if (!manager.AudioOutputPath(audio_path, error) || audio_path != expected_dir) {
    Fail("AudioOutputPath did not return the session directory");
  }

  for (const std::string& name : {master_name, mic_name, master_name}) {
    if (!manager.RegisterFile(name, error)) {
      Fail("RegisterFile failed: " + recsync::session::FormatSessionError(error));
    }
  }
  if (manager.RegisterFile("", error)) {
    Fail("RegisterFile accepted an empty filename");
  }
  ExpectCode(error, SessionErrorCode::kInvalidArgument, "empty filename");

  const std::optional<SessionInfo> snapshot = manager.GetCurrentSessionInfo();
  if (!snapshot.has_value() || snapshot->files_created.size() != 3U ||
      snapshot->files_created[0] != master_name || snapshot->files_created[1] != mic_name ||
      snapshot->files_created[2] != master_name) {
    Fail("files_created lost order or duplicates");
  }

  recsync::core::json::Value::Object metadata;
  metadata["device_count"] = recsync::core::json::MakeInteger(2);
  metadata["total_files"] = recsync::core::json::MakeString("caller-wins");
  fs::path manifest_path;
  if (!manager.Finalize(metadata, manifest_path, error)) {
    Fail("Finalize failed: " + recsync::session::FormatSessionError(error));
  }
  if (manifest_path != expected_dir / "session_info.json") {
    Fail("manifest written to unexpected path: " + manifest_path.string());
  }
  if (manager.last_outcome() != recsync::session::SessionStatus::kFinalized) {
    Fail("last_outcome is not finalized");
  }

  recsync::artifacts::SessionManifest manifest;
  std::string load_error;
  if (!recsync::artifacts::LoadSessionManifest(expected_dir, manifest, load_error)) {
    Fail("LoadSessionManifest failed: " + load_error);
  }
  if (manifest.files_created != snapshot->files_created) {
    Fail("manifest files_created differs from registration order");
  }
  const auto device_count = manifest.metadata.find("device_count");
  if (device_count == manifest.metadata.end() || !device_count->second.is_integer() ||
      device_count->second.integer_value != 2) {
    Fail("manifest metadata.device_count != 2");
  }
  if (manifest.metadata.at("total_files").string_value != "caller-wins") {
    Fail("caller metadata did not override the internal key");
  }
  if (!manifest.metadata.at("files_created").is_array()) {
    Fail("internal files_created metadata key missing");
  }

  const std::string manifest_text =
      recsync::tests::common::ReadFileToString(expected_dir / "session_info.json");
  AssertContains(manifest_text, "\"schema_version\": \"1.0\"");
  AssertContains(manifest_text, "\"total_files\": 3");
  AssertContains(manifest_text, "\"--ip-devices\"");

  ExpectNoSessionErrors(manager, "after finalize");
  if (logger.SessionId() != "-") {
    Fail("logger session id not reset after finalize");
  }

  // A new session after finalize starts clean and independent.
  SessionInfo next;
  CreateSessionOptions standalone;
  standalone.custom_timestamp = "2025-08-14_16-00-00";
  standalone.mode_override = recsync::naming::RecordingMode::kStandalone;
  if (!manager.CreateSession(standalone, next, error)) {
    Fail("CreateSession after finalize failed: " + recsync::session::FormatSessionError(error));
  }
  if (!next.files_created.empty() || !next.metadata.empty() ||
      next.session_dir != root / "recordings" / "standalone" / "2025-08-14_16-00-00") {
    Fail("new session inherited state from the previous one");
  }
  std::map<std::string, fs::path> standalone_paths;
  if (!manager.KinectOutputPaths(recsync::naming::CaptureRole::kStandalone, standalone_paths,
                                 error) ||
      standalone_paths.count("standalone") != 1U) {
    Fail("standalone KinectOutputPaths missing 'standalone' key");
  }
  manager.CleanupFailedSession();

  // A finalized directory is never reused.
  if (manager.CreateSession(SyncAt(kTimestamp), info, error)) {
    Fail("CreateSession reused a finalized session directory");
  }
  ExpectCode(error, SessionErrorCode::kDirectoryCreationFailed, "reused directory");
  if (manager.GetCurrentSessionInfo().has_value()) {
    Fail("failed CreateSession left a session active");
  }

  // Restart within the same clock second after a failed attempt reuses the
  // aborted directory and keeps what the first attempt captured.
  {
    const SessionManager::Clock frozen_clock = [] {
      return std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
    };
    SessionManager restarting(config, &logger, frozen_clock);
    SessionInfo first;
    if (!restarting.CreateSession({}, first, error)) {
      Fail("first attempt CreateSession failed: " + recsync::session::FormatSessionError(error));
    }
    if (!restarting.RegisterFile("first-attempt.wav", error)) {
      Fail("RegisterFile failed: " + recsync::session::FormatSessionError(error));
    }
    recsync::tests::common::WriteTextFixture(first.session_dir / "first-attempt.wav",
                                             "partial capture");
    restarting.CleanupFailedSession();
    if (!fs::exists(first.session_dir / "session_aborted.json")) {
      Fail("cleanup of first attempt did not mark the directory aborted");
    }

    SessionInfo second;
    if (!restarting.CreateSession({}, second, error)) {
      Fail("restart after cleanup failed: " + recsync::session::FormatSessionError(error));
    }
    if (second.session_dir != first.session_dir || !second.files_created.empty()) {
      Fail("restart did not start a fresh session in the same directory");
    }
    if (!fs::exists(first.session_dir / "first-attempt.wav")) {
      Fail("restart removed a capture from the aborted attempt");
    }
    if (fs::exists(first.session_dir / "session_aborted.json")) {
      Fail("restart kept the stale abort marker");
    }

    fs::path restart_manifest;
    if (!restarting.Finalize({}, restart_manifest, error)) {
      Fail("Finalize after restart failed: " + recsync::session::FormatSessionError(error));
    }
    if (restarting.CreateSession({}, second, error)) {
      Fail("CreateSession reused a directory finalized by the restarted session");
    }
    ExpectCode(error, SessionErrorCode::kDirectoryCreationFailed, "finalized restart directory");
  }

  if (manager.CreateSession(SyncAt("../escape"), info, error)) {
    Fail("CreateSession accepted a timestamp with a path separator");
  }
  ExpectCode(error, SessionErrorCode::kInvalidArgument, "bad timestamp");

  const std::string log_text = log_stream.str();
  AssertContains(log_text, "msg=\"session created\"");
  AssertContains(log_text, "msg=\"file registered\"");
  AssertContains(log_text, "msg=\"session finalized\"");
  AssertContains(log_text, "session=\"2025-08-14_15-30-45\"");

  recsync::tests::common::RemovePathBestEffort(root);
  return 0;
}
