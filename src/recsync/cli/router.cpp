#include "recsync/cli/router.hpp"

#include "artifacts/session_manifest_writer.hpp"
#include "config/recorder_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_utils.hpp"
#include "naming/device_name_resolver.hpp"
#include "session/recording_plan.hpp"
#include "session/session_manager.hpp"

#include <charconv>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace recsync::cli {

namespace {

constexpr std::string_view kDefaultConfigPath = "config.json";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitSessionConflict =
    core::errors::ToInt(core::errors::ExitCode::kSessionConflict);
constexpr int kExitManifestWriteFailed =
    core::errors::ToInt(core::errors::ExitCode::kManifestWriteFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  recsync init-config [--config <path>]\n"
      << "  recsync resolve-name <camera|audio> <index> [--host <id>] [--config <path>]\n"
      << "  recsync record [--config <path>] [--mode <sync|standalone>] [--timestamp <ts>] "
         "[--base-dir <dir>] [--abort] [--log-level <debug|info|warn|error>]\n"
      << "  recsync show <session_dir|session_info.json>\n"
      << "  recsync version\n";
}

int ExitCodeFor(const session::SessionError& error) {
  switch (error.code) {
  case session::SessionErrorCode::kNone:
    return kExitSuccess;
  case session::SessionErrorCode::kAlreadyActive:
  case session::SessionErrorCode::kInvalidState:
    return kExitSessionConflict;
  case session::SessionErrorCode::kInvalidArgument:
    return kExitUsage;
  case session::SessionErrorCode::kDirectoryCreationFailed:
    return kExitFailure;
  case session::SessionErrorCode::kManifestWriteFailed:
    return kExitManifestWriteFailed;
  }
  return kExitFailure;
}

bool ParseDeviceIndex(std::string_view text, std::uint32_t& index, std::string& error) {
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, index);
  if (text.empty() || ec != std::errc() || ptr != end) {
    error = "device index must be a non-negative integer: " + std::string(text);
    return false;
  }
  return true;
}

// Consumes the value after a flag. Returns false when the flag is last.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[++i];
  return true;
}

// Missing `--config` means built-in defaults; an explicit path must load.
bool LoadConfigForCommand(const fs::path& config_path, config::RecorderConfig& config,
                          std::string& error) {
  if (config_path.empty()) {
    config = config::DefaultRecorderConfig();
    return true;
  }
  return config::LoadRecorderConfigFile(config_path, config, error);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "recsync 0.1.0\n";
  return kExitSuccess;
}

int CommandInitConfig(const std::vector<std::string_view>& args) {
  fs::path config_path(kDefaultConfigPath);
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (args[i] == "--config") {
      if (!TakeValue(args, i, args[i], value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      config_path = fs::path(value);
      continue;
    }
    std::cerr << "error: unknown option: " << args[i] << '\n';
    return kExitUsage;
  }

  config::RecorderConfig config;
  bool created = false;
  if (!config::LoadOrCreateRecorderConfig(config_path, config, created, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  std::cout << "config: " << config_path.string() << (created ? " (created)" : " (existing)")
            << '\n';
  return kExitSuccess;
}

int CommandResolveName(const std::vector<std::string_view>& args) {
  fs::path config_path;
  std::string host_identifier;
  std::vector<std::string_view> positionals;
  std::string error;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--host" || token == "--config") {
      if (!TakeValue(args, i, token, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      if (token == "--host") {
        host_identifier = std::string(value);
      } else {
        config_path = fs::path(value);
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
    positionals.push_back(token);
  }

  if (positionals.size() != 2U) {
    std::cerr << "error: resolve-name requires <camera|audio> <index>\n";
    return kExitUsage;
  }
  naming::DeviceClass device_class = naming::DeviceClass::kCamera;
  if (!naming::ParseDeviceClass(positionals[0], device_class)) {
    std::cerr << "error: device class must be camera or audio: " << positionals[0] << '\n';
    return kExitUsage;
  }
  std::uint32_t index = 0;
  if (!ParseDeviceIndex(positionals[1], index, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::RecorderConfig config;
  if (!LoadConfigForCommand(config_path, config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  const naming::NamingConfiguration naming_config = config::MakeNamingConfiguration(config);
  std::cout << naming::ResolveFriendlyName(device_class, host_identifier, index, naming_config)
            << '\n';
  return kExitSuccess;
}

bool ParseRecordOptions(const std::vector<std::string_view>& args, RecordOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--abort") {
      options.abort = true;
      continue;
    }
    if (token == "--config") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.config_path = fs::path(value);
      continue;
    }
    if (token == "--mode") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      naming::RecordingMode mode = naming::RecordingMode::kSync;
      if (!naming::ParseRecordingMode(value, mode)) {
        error = "invalid --mode '" + std::string(value) + "' (expected sync|standalone)";
        return false;
      }
      options.mode = mode;
      continue;
    }
    if (token == "--timestamp") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.timestamp = std::string(value);
      continue;
    }
    if (token == "--base-dir") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.base_dir = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    error = "unknown argument for record: " + std::string(token);
    return false;
  }
  return true;
}

int CommandRecord(const std::vector<std::string_view>& args) {
  RecordOptions options;
  std::string error;
  if (!ParseRecordOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteRecord(options);
}

int CommandShow(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: show requires exactly 1 argument: <session_dir|session_info.json>\n";
    return kExitUsage;
  }

  artifacts::SessionManifest manifest;
  std::string error;
  if (!artifacts::LoadSessionManifest(fs::path(args.front()), manifest, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "timestamp: " << manifest.timestamp << '\n'
            << "mode: " << naming::ToString(manifest.mode) << '\n'
            << "session_dir: " << manifest.session_dir.string() << '\n'
            << "schema_version: " << manifest.schema_version << '\n'
            << "files: " << manifest.files_created.size() << '\n';
  for (const auto& filename : manifest.files_created) {
    std::cout << "  " << filename << '\n';
  }
  for (const auto& [key, value] : manifest.metadata) {
    if (key == "files_created") {
      continue;
    }
    std::cout << "metadata." << key << ": " << core::ToJsonText(value) << '\n';
  }
  return kExitSuccess;
}

} // namespace

int ExecuteRecord(const RecordOptions& options) {
  config::RecorderConfig config;
  std::string error;
  if (!LoadConfigForCommand(options.config_path, config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (options.base_dir.has_value()) {
    config.recording.base_output_dir = *options.base_dir;
  }

  core::logging::Logger logger(options.log_level);
  session::SessionManager manager(config, &logger);

  session::CreateSessionOptions create_options;
  create_options.custom_timestamp = options.timestamp;
  create_options.mode_override = options.mode;

  session::SessionInfo info;
  session::SessionError session_error;
  if (!manager.CreateSession(create_options, info, session_error)) {
    std::cerr << "error: " << session::FormatSessionError(session_error) << '\n';
    return ExitCodeFor(session_error);
  }
  std::cout << "session_dir: " << info.session_dir.string() << '\n';

  const std::vector<naming::DeviceDescriptor> plan = session::BuildRecordingPlan(config, info.mode);
  for (const auto& device : plan) {
    std::string filename;
    if (!manager.GenerateFilename(device, filename, session_error) ||
        !manager.RegisterFile(filename, session_error)) {
      std::cerr << "error: " << session::FormatSessionError(session_error) << '\n';
      manager.CleanupFailedSession();
      return ExitCodeFor(session_error);
    }
    std::cout << session::DescribePlannedDevice(device) << " -> " << filename << '\n';
  }

  if (options.abort) {
    manager.CleanupFailedSession();
    std::cout << "session aborted: " << info.timestamp << '\n';
    return kExitSuccess;
  }

  core::json::Value::Object metadata;
  metadata["mode"] = core::json::MakeString(naming::ToString(info.mode));
  metadata["device_count"] =
      core::json::MakeInteger(static_cast<std::int64_t>(session::CountPlannedDevices(plan)));
  metadata["duration"] = core::json::MakeInteger(config.recording.duration_s);

  fs::path manifest_path;
  if (!manager.Finalize(metadata, manifest_path, session_error)) {
    std::cerr << "error: " << session::FormatSessionError(session_error) << '\n';
    manager.CleanupFailedSession();
    return ExitCodeFor(session_error);
  }
  std::cout << "manifest: " << manifest_path.string() << '\n';
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "init-config") {
    return CommandInitConfig(args);
  }
  if (command == "resolve-name") {
    return CommandResolveName(args);
  }
  if (command == "record") {
    return CommandRecord(args);
  }
  if (command == "show") {
    return CommandShow(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace recsync::cli
