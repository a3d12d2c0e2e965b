#include "config/recorder_config.hpp"

#include <catch2/catch.hpp>

#include <cstdint>
#include <string>
#include <vector>

using recsync::config::RecorderConfig;

TEST_CASE("Defaults carry the shipped device tables", "[config]") {
  const RecorderConfig config = recsync::config::DefaultRecorderConfig();
  REQUIRE(config.recording.mode == recsync::naming::RecordingMode::kSync);
  REQUIRE(config.recording.duration_s == 10);
  REQUIRE(config.recording.base_output_dir.generic_string() == "recordings");
  REQUIRE(config.recording.timestamp_format == "%Y-%m-%d_%H-%M-%S");
  REQUIRE(config.recording.cleanup_policy == recsync::config::CleanupPolicy::kMarkAborted);
  REQUIRE(config.kinect.ip_devices.at("127.0.0.1") == std::vector<std::uint32_t>{0, 2, 3});
  REQUIRE(config.kinect.device_names.at("127.0.0.1").at(2) == "left_cam");
  REQUIRE(config.kinect.device_names.at("local").at(1) == "standalone_cam");
  REQUIRE(config.audio.device_names.at(6) == "wireless_mic");
  REQUIRE(config.audio.input_device_index == std::vector<std::uint32_t>{1});
}

TEST_CASE("Config text overlays defaults entry by entry", "[config]") {
  RecorderConfig config;
  std::string error;
  REQUIRE(recsync::config::ParseRecorderConfigText(R"({
    "recording": {"mode": "standalone", "duration": 30, "cleanup_policy": "remove_tracked"},
    "kinect": {
      "device_names": {"127.0.0.1": {"2": "west_cam"}, "192.168.1.50": {"0": "far_cam"}},
      "--ip-devices": {"192.168.1.50": [0, 1]}
    },
    "audio": {"device_names": {"9": "lav_mic"}},
    "future_section": {"ignored": true}
  })",
                                                   config, error));

  REQUIRE(config.recording.mode == recsync::naming::RecordingMode::kStandalone);
  REQUIRE(config.recording.duration_s == 30);
  REQUIRE(config.recording.cleanup_policy == recsync::config::CleanupPolicy::kRemoveTracked);
  REQUIRE(config.recording.base_output_dir.generic_string() == "recordings");

  REQUIRE(config.kinect.device_names.at("127.0.0.1").at(0) == "master_cam");
  REQUIRE(config.kinect.device_names.at("127.0.0.1").at(2) == "west_cam");
  REQUIRE(config.kinect.device_names.at("192.168.1.50").at(0) == "far_cam");
  REQUIRE(config.kinect.ip_devices.at("127.0.0.1") == std::vector<std::uint32_t>{0, 2, 3});
  REQUIRE(config.kinect.ip_devices.at("192.168.1.50") == std::vector<std::uint32_t>{0, 1});

  REQUIRE(config.audio.device_names.at(1) == "main_mic");
  REQUIRE(config.audio.device_names.at(9) == "lav_mic");
}

TEST_CASE("Invalid config values name the offending field", "[config]") {
  RecorderConfig config = recsync::config::DefaultRecorderConfig();
  const RecorderConfig untouched = config;
  std::string error;

  REQUIRE_FALSE(
      recsync::config::ParseRecorderConfigText(R"({"recording": {"mode": "burst"}})", config, error));
  REQUIRE(error.find("recording.mode") != std::string::npos);

  REQUIRE_FALSE(recsync::config::ParseRecorderConfigText(
      R"({"kinect": {"device_names": {"127.0.0.1": {"x": "cam"}}}})", config, error));
  REQUIRE(error.find("kinect.device_names.127.0.0.1.x") != std::string::npos);

  REQUIRE_FALSE(recsync::config::ParseRecorderConfigText(
      R"({"audio": {"device_names": {"1": "../escape"}}})", config, error));
  REQUIRE(error.find("path separators") != std::string::npos);

  REQUIRE_FALSE(recsync::config::ParseRecorderConfigText(
      R"({"audio": {"input_device_index": [-1]}})", config, error));
  REQUIRE(error.find("audio.input_device_index") != std::string::npos);

  REQUIRE_FALSE(recsync::config::ParseRecorderConfigText("[1, 2]", config, error));
  REQUIRE(error.find("root") != std::string::npos);

  REQUIRE_FALSE(recsync::config::ParseRecorderConfigText("{", config, error));
  REQUIRE(error.find("invalid config JSON") != std::string::npos);

  REQUIRE(config == untouched);
}

TEST_CASE("Serialized config parses back to the same config", "[config]") {
  RecorderConfig config = recsync::config::DefaultRecorderConfig();
  config.recording.sync_delay_s = 1.25;
  config.kinect.sync_master = {"192.168.1.50", 1};
  config.kinect.ip_devices["192.168.1.50"] = {1, 4};

  const std::string text = recsync::config::ToJson(config);
  REQUIRE(text.back() == '\n');

  RecorderConfig reparsed;
  std::string error;
  REQUIRE(recsync::config::ParseRecorderConfigText(text, reparsed, error));
  REQUIRE(reparsed == config);
}

TEST_CASE("Naming snapshot mirrors the config tables", "[config][naming]") {
  RecorderConfig config = recsync::config::DefaultRecorderConfig();
  config.recording.base_output_dir = "/data/captures";
  const recsync::naming::NamingConfiguration naming =
      recsync::config::MakeNamingConfiguration(config);
  REQUIRE(naming.camera_names == config.kinect.device_names);
  REQUIRE(naming.audio_names == config.audio.device_names);
  REQUIRE(naming.base_output_dir.generic_string() == "/data/captures");
  REQUIRE(naming.timestamp_format == config.recording.timestamp_format);
  REQUIRE(naming.default_mode == config.recording.mode);
}
