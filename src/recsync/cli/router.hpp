#pragma once

#include "core/logging/logger.hpp"
#include "naming/device_model.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace recsync::cli {

// Options of `recsync record`, shared with in-process callers.
struct RecordOptions {
  std::filesystem::path config_path;
  std::optional<naming::RecordingMode> mode;
  std::optional<std::string> timestamp;
  std::optional<std::filesystem::path> base_dir;
  bool abort = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Creates a session, names and registers every planned device, then finalizes
// it (or runs failure cleanup when `abort` is set). Returns a process exit code.
int ExecuteRecord(const RecordOptions& options);

// Routes `recsync` subcommands. Exit codes follow core::errors::ExitCode:
//   0 success, 1 failure, 2 usage, 10 config invalid,
//   20 session state conflict, 30 manifest write failed
int Dispatch(int argc, char** argv);

} // namespace recsync::cli
