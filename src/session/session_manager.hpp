#pragma once

#include "config/recorder_config.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "naming/device_model.hpp"
#include "naming/filename_generator.hpp"
#include "session/session_types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace recsync::session {

// Owns the single recording session of a coordinator process.
//
// State machine: no session -> Active -> {Finalized | Aborted}. Only
// CreateSession, RegisterFile, Finalize and CleanupFailedSession change state.
// Every public call takes the same mutex, so capture callbacks may report
// finished files from their own threads.
//
// Configuration is snapshotted at CreateSession: UpdateConfiguration only
// affects sessions created afterwards.
class SessionManager {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit SessionManager(config::RecorderConfig config,
                          core::logging::Logger* logger = nullptr, Clock clock = {});

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;
  SessionManager(SessionManager&&) = delete;
  SessionManager& operator=(SessionManager&&) = delete;

  // Starts a session and creates `<base>/<mode>/<timestamp>`.
  //
  // Fails with:
  // - kAlreadyActive when a session is still active (it is left untouched)
  // - kInvalidArgument when the timestamp cannot be a directory name
  // - kDirectoryCreationFailed when the directory cannot be created or
  //   already holds files; no session becomes active
  bool CreateSession(const CreateSessionOptions& options, SessionInfo& info,
                     SessionError& error);

  // Appends a produced filename. Order is kept and duplicates are allowed.
  bool RegisterFile(std::string_view filename, SessionError& error);

  // Snapshot of the active session; empty when none is active.
  std::optional<SessionInfo> GetCurrentSessionInfo() const;

  // Name generation has no side effects: the caller registers the file once
  // the capture process reports it finished.
  bool GenerateKinectFilename(naming::CaptureRole role, std::string_view host_identifier,
                              std::uint32_t device_index, std::string& filename,
                              SessionError& error) const;
  bool GenerateAudioFilename(std::uint32_t device_index, std::string& filename,
                             SessionError& error) const;
  bool GenerateFilename(const naming::DeviceDescriptor& device, std::string& filename,
                        SessionError& error) const;

  // Output map handed to camera recorders: {"standalone": dir} for the
  // standalone role, {"sync": dir} for master and subordinate.
  bool KinectOutputPaths(naming::CaptureRole role,
                         std::map<std::string, std::filesystem::path>& paths,
                         SessionError& error) const;
  bool AudioOutputPath(std::filesystem::path& path, SessionError& error) const;

  // Merges `metadata` over the session-internal keys (caller wins), writes
  // `session_info.json` and ends the session.
  //
  // A manifest write failure returns kManifestWriteFailed and leaves the
  // session Active with its metadata unchanged, so Finalize can be retried.
  bool Finalize(const core::json::Value::Object& metadata,
                std::filesystem::path& manifest_path, SessionError& error);

  // Best-effort abort of the active session; no-op without one. Each step is
  // guarded on its own and failures are only logged. Files the session did not
  // register are never touched.
  void CleanupFailedSession() noexcept;

  void UpdateConfiguration(config::RecorderConfig config);
  config::RecorderConfig configuration() const;

  // Terminal status of the most recent session, if any has ended.
  std::optional<SessionStatus> last_outcome() const;

private:
  struct ActiveSession {
    SessionInfo info;
    naming::FilenameGenerator filenames;
    config::RecorderConfig config;
  };

  bool RequireActiveLocked(std::string_view operation, SessionError& error) const;
  void AbortLocked(ActiveSession& session);
  void EndSessionLocked(SessionStatus status);

  mutable std::mutex mu_;
  config::RecorderConfig config_;
  core::logging::Logger* logger_ = nullptr;
  Clock clock_;
  std::optional<ActiveSession> active_;
  std::optional<SessionStatus> last_outcome_;
};

} // namespace recsync::session
