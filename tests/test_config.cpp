#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "vscrubsdk/config.h"

using namespace vscrub::sdk;

TEST(Config, DefaultsAreValid) {
  OrchestratorConfig cfg;
  std::string err;
  EXPECT_TRUE(validate_config(cfg, err)) << err;
  EXPECT_DOUBLE_EQ(cfg.chunk_duration_s, 60.0);
  EXPECT_DOUBLE_EQ(cfg.overlap_s, 5.0);
  EXPECT_DOUBLE_EQ(cfg.tau, 0.75);
}

TEST(Config, OverlaysCamelCaseKeys) {
  OrchestratorConfig cfg;
  std::string err;
  const nlohmann::json j{{"chunkDurationS", 30.0}, {"overlapS", 2}, {"workerCount", 8}, {"natsUrl", "nats://h:4222"}};
  ASSERT_TRUE(apply_config_json(j, cfg, err)) << err;
  EXPECT_DOUBLE_EQ(cfg.chunk_duration_s, 30.0);
  EXPECT_DOUBLE_EQ(cfg.overlap_s, 2.0);
  EXPECT_EQ(cfg.worker_count, 8);
  EXPECT_EQ(cfg.nats_url, "nats://h:4222");
  // Untouched keys keep their defaults.
  EXPECT_EQ(cfg.kv_bucket, "vscrub_jobs");
}

TEST(Config, RejectsWrongTypes) {
  OrchestratorConfig cfg;
  std::string err;
  EXPECT_FALSE(apply_config_json(nlohmann::json{{"workerCount", "many"}}, cfg, err));
  EXPECT_NE(err.find("workerCount"), std::string::npos);
  EXPECT_FALSE(apply_config_json(nlohmann::json::array(), cfg, err));
}

TEST(Config, ValidationCatchesBadBounds) {
  std::string err;
  OrchestratorConfig overlap;
  overlap.overlap_s = 60.0;
  EXPECT_FALSE(validate_config(overlap, err));

  OrchestratorConfig tau;
  tau.tau = 1.5;
  EXPECT_FALSE(validate_config(tau, err));

  OrchestratorConfig fourcc;
  fourcc.output_fourcc = "h264x";
  EXPECT_FALSE(validate_config(fourcc, err));

  OrchestratorConfig attempts;
  attempts.chunk_max_attempts = 0;
  EXPECT_FALSE(validate_config(attempts, err));
}

TEST(Config, DetectorEntriesNeedLabelAndModel) {
  OrchestratorConfig cfg;
  std::string err;
  const nlohmann::json j{{"detectors", {"plate=/models/plate.xml", "logo=/models/logo.xml"}}};
  ASSERT_TRUE(apply_config_json(j, cfg, err)) << err;
  ASSERT_EQ(cfg.detectors.size(), 2u);
  EXPECT_TRUE(validate_config(cfg, err)) << err;

  std::string label;
  std::string model;
  ASSERT_TRUE(split_detector_entry(cfg.detectors[0], label, model));
  EXPECT_EQ(label, "plate");
  EXPECT_EQ(model, "/models/plate.xml");
  EXPECT_FALSE(split_detector_entry("plate", label, model));
  EXPECT_FALSE(split_detector_entry("=/models/plate.xml", label, model));
  EXPECT_FALSE(split_detector_entry("plate=", label, model));

  cfg.detectors.push_back("no-separator");
  EXPECT_FALSE(validate_config(cfg, err));
  EXPECT_NE(err.find("no-separator"), std::string::npos);
}

TEST(Config, FileRoundTripThroughJson) {
  OrchestratorConfig cfg;
  cfg.tau = 0.6;
  cfg.blob_root = "/var/lib/vscrub";
  const auto path = std::filesystem::temp_directory_path() / "vscrub_config_test.json";
  {
    std::ofstream out(path);
    out << config_to_json(cfg).dump();
  }
  OrchestratorConfig loaded;
  std::string err;
  ASSERT_TRUE(load_config_file(path.string(), loaded, err)) << err;
  EXPECT_DOUBLE_EQ(loaded.tau, 0.6);
  EXPECT_EQ(loaded.blob_root, "/var/lib/vscrub");
  std::filesystem::remove(path);

  EXPECT_FALSE(load_config_file("/nonexistent/vscrub.json", loaded, err));
}
