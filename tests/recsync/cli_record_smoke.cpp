#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using recsync::tests::common::AssertContains;
using recsync::tests::common::AssertNotContains;
using recsync::tests::common::DispatchWithCapturedOutput;
using recsync::tests::common::Fail;

namespace {

int Run(const std::vector<std::string>& argv, std::string& out, std::string& err) {
  return DispatchWithCapturedOutput(argv, out, err);
}

void ExpectExit(int actual, int expected, std::string_view context, const std::string& err) {
  if (actual != expected) {
    Fail(std::string(context) + ": exit " + std::to_string(actual) + " (expected " +
         std::to_string(expected) + ")\n" + err);
  }
}

} // namespace

int main() {
  const fs::path root = recsync::tests::common::CreateUniqueTempDir("recsync-cli-record");
  const fs::path config_path = root / "config.json";
  const fs::path base_dir = root / "recordings";
  std::string out;
  std::string err;

  ExpectExit(Run({"recsync", "version"}, out, err), 0, "version", err);
  AssertContains(out, "recsync ");

  ExpectExit(Run({"recsync"}, out, err), 2, "no command", err);
  AssertContains(err, "usage:");
  ExpectExit(Run({"recsync", "launch"}, out, err), 2, "unknown command", err);
  AssertContains(err, "unknown subcommand: launch");

  ExpectExit(Run({"recsync", "init-config", "--config", config_path.string()}, out, err), 0,
             "init-config", err);
  AssertContains(out, "(created)");
  ExpectExit(Run({"recsync", "init-config", "--config", config_path.string()}, out, err), 0,
             "init-config again", err);
  AssertContains(out, "(existing)");

  ExpectExit(Run({"recsync", "resolve-name", "camera", "2", "--host", "127.0.0.1", "--config",
                  config_path.string()},
                 out, err),
             0, "resolve-name camera", err);
  if (out != "left_cam\n") {
    Fail("resolve-name camera printed: " + out);
  }
  ExpectExit(Run({"recsync", "resolve-name", "audio", "8"}, out, err), 0, "resolve-name audio",
             err);
  if (out != "audio8\n") {
    Fail("resolve-name audio printed: " + out);
  }
  ExpectExit(Run({"recsync", "resolve-name", "camera", "-3"}, out, err), 2,
             "resolve-name bad index", err);

  // Sync record with a fixed timestamp.
  ExpectExit(Run({"recsync", "record", "--config", config_path.string(), "--base-dir",
                  base_dir.string(), "--timestamp", "2025-08-14_15-30-45", "--log-level",
                  "debug"},
                 out, err),
             0, "record sync", err);
  AssertContains(out, "camera master 127.0.0.1 0 -> 2025-08-14_15-30-45-master-master_cam.mkv");
  AssertContains(out, "camera subordinate 127.0.0.1 2 -> 2025-08-14_15-30-45-sub-left_cam.mkv");
  AssertContains(out, "audio 1 -> 2025-08-14_15-30-45-main_mic.wav");
  AssertContains(out, "manifest: ");
  AssertContains(err, "msg=\"session finalized\"");

  const fs::path session_dir = base_dir / "sync" / "2025-08-14_15-30-45";
  ExpectExit(Run({"recsync", "show", session_dir.string()}, out, err), 0, "show", err);
  AssertContains(out, "timestamp: 2025-08-14_15-30-45");
  AssertContains(out, "files: 4");
  AssertContains(out, "metadata.device_count: 4");
  AssertContains(out, "metadata.duration: 10");
  AssertContains(out, "metadata.mode: \"sync\"");

  // Same timestamp again: the finalized directory is not reused.
  ExpectExit(Run({"recsync", "record", "--base-dir", base_dir.string(), "--timestamp",
                  "2025-08-14_15-30-45"},
                 out, err),
             1, "record into existing session", err);
  AssertContains(err, "DIRECTORY_CREATION_FAILED");

  // Standalone + abort never writes a manifest.
  ExpectExit(Run({"recsync", "record", "--base-dir", base_dir.string(), "--mode", "standalone",
                  "--timestamp", "aborted-1", "--abort"},
                 out, err),
             0, "record --abort", err);
  AssertContains(out, "camera standalone local 1 -> aborted-1-standalone-standalone_cam.mkv");
  AssertContains(out, "session aborted: aborted-1");
  AssertNotContains(out, "manifest: ");
  const fs::path aborted_dir = base_dir / "standalone" / "aborted-1";
  if (fs::exists(aborted_dir / "session_info.json")) {
    Fail("aborted session wrote a manifest");
  }

  ExpectExit(Run({"recsync", "record", "--mode", "burst"}, out, err), 2, "record bad mode", err);
  ExpectExit(Run({"recsync", "record", "--timestamp", "../x", "--base-dir", base_dir.string()},
                 out, err),
             2, "record bad timestamp", err);
  AssertContains(err, "INVALID_ARGUMENT");
  ExpectExit(Run({"recsync", "record", "--config", (root / "missing.json").string()}, out, err),
             10, "record missing config", err);
  ExpectExit(Run({"recsync", "show", (root / "nowhere").string()}, out, err), 1, "show missing",
             err);

  recsync::tests::common::RemovePathBestEffort(root);
  return 0;
}
