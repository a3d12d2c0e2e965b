#include "session/session_types.hpp"

namespace recsync::session {

const char* ToString(const SessionStatus status) {
  switch (status) {
  case SessionStatus::kActive:
    return "active";
  case SessionStatus::kFinalized:
    return "finalized";
  case SessionStatus::kAborted:
    return "aborted";
  }
  return "active";
}

std::string_view ToStableErrorCode(const SessionErrorCode code) {
  switch (code) {
  case SessionErrorCode::kNone:
    return "NONE";
  case SessionErrorCode::kAlreadyActive:
    return "ALREADY_ACTIVE";
  case SessionErrorCode::kInvalidState:
    return "INVALID_STATE";
  case SessionErrorCode::kInvalidArgument:
    return "INVALID_ARGUMENT";
  case SessionErrorCode::kDirectoryCreationFailed:
    return "DIRECTORY_CREATION_FAILED";
  case SessionErrorCode::kManifestWriteFailed:
    return "MANIFEST_WRITE_FAILED";
  }
  return "NONE";
}

std::string FormatSessionError(const SessionError& error) {
  if (!error) {
    return {};
  }
  return std::string(ToStableErrorCode(error.code)) + ": " + error.message;
}

} // namespace recsync::session
