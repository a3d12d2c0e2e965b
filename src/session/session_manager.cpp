#include "session/session_manager.hpp"

#include "artifacts/abort_marker_writer.hpp"
#include "artifacts/output_dir_utils.hpp"
#include "artifacts/session_manifest_writer.hpp"
#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "naming/path_builder.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace recsync::session {

namespace {

constexpr std::string_view kNoActiveSessionMessage = "no active recording session";

void SetError(SessionError& error, SessionErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
}

// A registered name must stay inside the session directory before cleanup may
// act on it.
bool IsPlainFilename(std::string_view filename) {
  if (filename.empty() || filename == "." || filename == "..") {
    return false;
  }
  return filename.find_first_of("/\\") == std::string_view::npos;
}

} // namespace

SessionManager::SessionManager(config::RecorderConfig config, core::logging::Logger* logger,
                               Clock clock)
    : config_(std::move(config)), logger_(logger), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

bool SessionManager::CreateSession(const CreateSessionOptions& options, SessionInfo& info,
                                   SessionError& error) {
  std::lock_guard<std::mutex> lock(mu_);
  error.Clear();

  if (active_.has_value()) {
    SetError(error, SessionErrorCode::kAlreadyActive,
             "a recording session is already active (timestamp " + active_->info.timestamp +
                 "); finalize or clean it up first");
    return false;
  }

  const auto created_at = clock_();
  std::string timestamp = options.custom_timestamp.has_value()
                              ? *options.custom_timestamp
                              : core::FormatLocalTimestamp(created_at,
                                                           config_.recording.timestamp_format);
  std::string validation_error;
  if (!naming::ValidateTimestampComponent(timestamp, validation_error)) {
    SetError(error, SessionErrorCode::kInvalidArgument, validation_error);
    return false;
  }

  const naming::RecordingMode mode = options.mode_override.value_or(config_.recording.mode);
  const fs::path base_dir = config_.recording.base_output_dir;
  const fs::path session_dir = naming::BuildSessionPath(mode, timestamp, base_dir);

  bool created_dir = false;
  std::string dir_error;
  if (!artifacts::EnsureSessionDir(session_dir, created_dir, dir_error)) {
    SetError(error, SessionErrorCode::kDirectoryCreationFailed, dir_error);
    if (logger_ != nullptr) {
      logger_->Error("session directory unavailable",
                     {{"session_dir", session_dir.string()}, {"error", dir_error}});
    }
    return false;
  }

  // Restart after an aborted session at the same timestamp: the directory is
  // reused and its marker no longer describes the active session.
  if (!created_dir) {
    std::string marker_error;
    if (!core::RemoveFileIfPresent(session_dir / std::string(artifacts::kAbortMarkerFileName),
                                   marker_error) &&
        logger_ != nullptr) {
      logger_->Warn("stale abort marker left in reused session directory",
                    {{"error", marker_error}});
    }
  }

  SessionInfo session_info;
  session_info.timestamp = timestamp;
  session_info.mode = mode;
  session_info.base_dir = base_dir;
  session_info.session_dir = session_dir;
  session_info.status = SessionStatus::kActive;
  session_info.created_at = created_at;

  active_.emplace(ActiveSession{
      .info = session_info,
      .filenames = naming::FilenameGenerator(timestamp, config::MakeNamingConfiguration(config_)),
      .config = config_,
  });

  if (logger_ != nullptr) {
    logger_->SetSessionId(timestamp);
    logger_->Info("session created", {{"mode", naming::ToString(mode)},
                                      {"session_dir", session_dir.string()},
                                      {"dir_created", created_dir ? "true" : "false"}});
  }

  info = std::move(session_info);
  return true;
}

bool SessionManager::RegisterFile(std::string_view filename, SessionError& error) {
  std::lock_guard<std::mutex> lock(mu_);
  error.Clear();
  if (!RequireActiveLocked("register a file", error)) {
    return false;
  }
  if (filename.empty()) {
    SetError(error, SessionErrorCode::kInvalidArgument, "filename cannot be empty");
    return false;
  }

  active_->info.files_created.emplace_back(filename);
  if (logger_ != nullptr) {
    logger_->Debug("file registered",
                   {{"file", filename},
                    {"count", std::to_string(active_->info.files_created.size())}});
  }
  return true;
}

std::optional<SessionInfo> SessionManager::GetCurrentSessionInfo() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (!active_.has_value()) {
    return std::nullopt;
  }
  return active_->info;
}

bool SessionManager::GenerateKinectFilename(naming::CaptureRole role,
                                            std::string_view host_identifier,
                                            std::uint32_t device_index, std::string& filename,
                                            SessionError& error) const {
  std::lock_guard<std::mutex> lock(mu_);
  error.Clear();
  if (!RequireActiveLocked("generate a camera filename", error)) {
    return false;
  }
  filename = active_->filenames.KinectFilename(role, host_identifier, device_index);
  return true;
}

bool SessionManager::GenerateAudioFilename(std::uint32_t device_index, std::string& filename,
                                           SessionError& error) const {
  std::lock_guard<std::mutex> lock(mu_);
  error.Clear();
  if (!RequireActiveLocked("generate an audio filename", error)) {
    return false;
  }
  filename = active_->filenames.AudioFilename(device_index);
  return true;
}

bool SessionManager::GenerateFilename(const naming::DeviceDescriptor& device,
                                      std::string& filename, SessionError& error) const {
  std::lock_guard<std::mutex> lock(mu_);
  error.Clear();
  if (!RequireActiveLocked("generate a filename", error)) {
    return false;
  }
  filename = active_->filenames.FilenameFor(device);
  return true;
}

bool SessionManager::KinectOutputPaths(naming::CaptureRole role,
                                       std::map<std::string, fs::path>& paths,
                                       SessionError& error) const {
  std::lock_guard<std::mutex> lock(mu_);
  error.Clear();
  if (!RequireActiveLocked("resolve camera output paths", error)) {
    return false;
  }
  const naming::RecordingMode key_mode = role == naming::CaptureRole::kStandalone
                                             ? naming::RecordingMode::kStandalone
                                             : naming::RecordingMode::kSync;
  paths.clear();
  paths.emplace(naming::ToString(key_mode), active_->info.session_dir);
  return true;
}

bool SessionManager::AudioOutputPath(fs::path& path, SessionError& error) const {
  std::lock_guard<std::mutex> lock(mu_);
  error.Clear();
  if (!RequireActiveLocked("resolve the audio output path", error)) {
    return false;
  }
  path = active_->info.session_dir;
  return true;
}

bool SessionManager::Finalize(const core::json::Value::Object& metadata,
                              fs::path& manifest_path, SessionError& error) {
  std::lock_guard<std::mutex> lock(mu_);
  error.Clear();
  if (!RequireActiveLocked("finalize", error)) {
    return false;
  }

  const SessionInfo& info = active_->info;

  core::json::Value files = core::json::MakeArray();
  for (const auto& filename : info.files_created) {
    files.array_value.push_back(core::json::MakeString(filename));
  }
  core::json::Value::Object merged = info.metadata;
  merged["files_created"] = std::move(files);
  merged["total_files"] =
      core::json::MakeInteger(static_cast<std::int64_t>(info.files_created.size()));
  for (const auto& [key, value] : metadata) {
    merged[key] = value;
  }

  artifacts::SessionManifest manifest;
  manifest.timestamp = info.timestamp;
  manifest.mode = info.mode;
  manifest.session_dir = info.session_dir;
  manifest.files_created = info.files_created;
  manifest.metadata = merged;
  manifest.created_at_utc = core::FormatUtcTimestamp(info.created_at);
  manifest.finalized_at_utc = core::FormatUtcTimestamp(clock_());
  artifacts::AttachConfigSnapshot(active_->config, manifest);

  fs::path written_path;
  std::string write_error;
  if (!artifacts::WriteSessionManifestJson(manifest, info.session_dir, written_path,
                                           write_error)) {
    SetError(error, SessionErrorCode::kManifestWriteFailed,
             "failed to write session manifest: " + write_error);
    if (logger_ != nullptr) {
      logger_->Error("session manifest write failed; session remains active",
                     {{"session_dir", info.session_dir.string()}, {"error", write_error}});
    }
    return false;
  }

  active_->info.metadata = std::move(merged);
  manifest_path = written_path;
  if (logger_ != nullptr) {
    logger_->Info("session finalized",
                  {{"manifest", written_path.string()},
                   {"total_files", std::to_string(info.files_created.size())}});
  }
  EndSessionLocked(SessionStatus::kFinalized);
  return true;
}

void SessionManager::CleanupFailedSession() noexcept {
  std::lock_guard<std::mutex> lock(mu_);
  if (!active_.has_value()) {
    return;
  }
  AbortLocked(*active_);
  EndSessionLocked(SessionStatus::kAborted);
}

void SessionManager::UpdateConfiguration(config::RecorderConfig config) {
  std::lock_guard<std::mutex> lock(mu_);
  config_ = std::move(config);
}

config::RecorderConfig SessionManager::configuration() const {
  std::lock_guard<std::mutex> lock(mu_);
  return config_;
}

std::optional<SessionStatus> SessionManager::last_outcome() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_outcome_;
}

bool SessionManager::RequireActiveLocked(std::string_view operation,
                                         SessionError& error) const {
  if (active_.has_value()) {
    return true;
  }
  SetError(error, SessionErrorCode::kInvalidState,
           std::string(kNoActiveSessionMessage) + ": cannot " + std::string(operation));
  return false;
}

// Steps run independently; one failing never skips the next. Only
// std::exception is caught: anything else is a programming error.
void SessionManager::AbortLocked(ActiveSession& session) {
  const SessionInfo& info = session.info;
  const config::CleanupPolicy policy = session.config.recording.cleanup_policy;

  const auto warn = [this](std::string_view message, std::string_view detail) {
    if (logger_ == nullptr) {
      return;
    }
    try {
      logger_->Warn(message, {{"error", detail}});
    } catch (const std::exception&) {
      // Logging failed too; the remaining steps still run.
    }
  };

  if (policy == config::CleanupPolicy::kRemoveTracked) {
    for (const auto& filename : info.files_created) {
      try {
        if (!IsPlainFilename(filename)) {
          warn("cleanup: skipped registered name outside session directory", filename);
          continue;
        }
        std::string remove_error;
        if (!core::RemoveFileIfPresent(info.session_dir / filename, remove_error)) {
          warn("cleanup: failed to remove tracked file", remove_error);
        }
      } catch (const std::exception& ex) {
        warn("cleanup: failed to remove tracked file", ex.what());
      }
    }
    try {
      core::RemoveDirectoryIfEmpty(info.session_dir);
    } catch (const std::exception& ex) {
      warn("cleanup: failed to remove session directory", ex.what());
    }
  } else {
    // The directory is kept and marked even when empty.
    try {
      std::error_code ec;
      if (!fs::is_directory(info.session_dir, ec)) {
        warn("cleanup: session directory missing; abort marker not written",
             info.session_dir.string());
      } else {
        artifacts::AbortMarker marker;
        marker.timestamp = info.timestamp;
        marker.mode = info.mode;
        marker.session_dir = info.session_dir;
        marker.tracked_files = info.files_created;
        marker.reason = "session cleanup after failure";
        marker.aborted_at_utc = core::FormatUtcTimestamp(clock_());
        fs::path marker_path;
        std::string marker_error;
        if (!artifacts::WriteAbortMarkerJson(marker, info.session_dir, marker_path,
                                             marker_error)) {
          warn("cleanup: failed to write abort marker", marker_error);
        }
      }
    } catch (const std::exception& ex) {
      warn("cleanup: failed to write abort marker", ex.what());
    }
  }

  if (logger_ == nullptr) {
    return;
  }
  try {
    logger_->Info("session aborted", {{"session_dir", info.session_dir.string()},
                                      {"policy", config::ToString(policy)},
                                      {"tracked_files",
                                       std::to_string(info.files_created.size())}});
  } catch (const std::exception& ex) {
    warn("cleanup: failed to log session abort", ex.what());
  }
}

void SessionManager::EndSessionLocked(SessionStatus status) {
  active_.reset();
  last_outcome_ = status;
  if (logger_ != nullptr) {
    logger_->SetSessionId("-");
  }
}

} // namespace recsync::session
