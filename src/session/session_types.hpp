#pragma once

#include "core/json_dom.hpp"
#include "naming/device_model.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recsync::session {

// Lifecycle of one session: Active until exactly one of finalize/cleanup moves
// it to a terminal state. Terminal sessions are never reused.
enum class SessionStatus {
  kActive = 0,
  kFinalized,
  kAborted,
};

const char* ToString(SessionStatus status);

// Failure classes surfaced by session operations. Codes are stable so the
// orchestration layer can decide between retry, abort and starting fresh.
enum class SessionErrorCode {
  kNone = 0,
  kAlreadyActive,
  kInvalidState,
  kInvalidArgument,
  kDirectoryCreationFailed,
  kManifestWriteFailed,
};

// Grep-friendly spelling: ALREADY_ACTIVE, INVALID_STATE, ...
std::string_view ToStableErrorCode(SessionErrorCode code);

struct SessionError {
  SessionErrorCode code = SessionErrorCode::kNone;
  std::string message;

  explicit operator bool() const { return code != SessionErrorCode::kNone; }

  void Clear() {
    code = SessionErrorCode::kNone;
    message.clear();
  }
};

// "<STABLE_CODE>: <message>", or an empty string when no error is set.
std::string FormatSessionError(const SessionError& error);

// Snapshot of one session. `timestamp` and `session_dir` never change after
// creation; `files_created` only grows while the session is active.
struct SessionInfo {
  std::string timestamp;
  naming::RecordingMode mode = naming::RecordingMode::kSync;
  std::filesystem::path base_dir;
  std::filesystem::path session_dir;
  std::vector<std::string> files_created;
  core::json::Value::Object metadata;
  SessionStatus status = SessionStatus::kActive;
  std::chrono::system_clock::time_point created_at{};
};

// Inputs to CreateSession. Unset fields fall back to the current local time
// (formatted per configuration) and the configured default mode.
struct CreateSessionOptions {
  std::optional<std::string> custom_timestamp;
  std::optional<naming::RecordingMode> mode_override;
};

} // namespace recsync::session
