// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <set>
#include <string>

#include <gflags/gflags.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "flags/general.hpp"
#include "flags/log_level.hpp"

TEST(LogLevelFlag, Validation) {
  EXPECT_TRUE(clusterprops::flags::ValidLogLevel("TRACE"));
  EXPECT_TRUE(clusterprops::flags::ValidLogLevel("WARNING"));
  EXPECT_FALSE(clusterprops::flags::ValidLogLevel(""));
  EXPECT_FALSE(clusterprops::flags::ValidLogLevel("warning"));
  EXPECT_FALSE(clusterprops::flags::ValidLogLevel("VERBOSE"));
}

TEST(LogLevelFlag, ToEnum) {
  EXPECT_EQ(clusterprops::flags::LogLevelToEnum("DEBUG"), spdlog::level::debug);
  EXPECT_EQ(clusterprops::flags::LogLevelToEnum("CRITICAL"), spdlog::level::critical);
  EXPECT_FALSE(clusterprops::flags::LogLevelToEnum("NONE").has_value());
}

class ClusterPropertiesFlags : public ::testing::Test {
 protected:
  gflags::FlagSaver saver_;
};

TEST_F(ClusterPropertiesFlags, Defaults) {
  const auto config = clusterprops::flags::ParseClusterPropertiesConfig();
  EXPECT_EQ(config.path, "/clusterprops.json");
  EXPECT_TRUE(config.known_properties.contains("urlScheme"));
  EXPECT_FALSE(config.retry_policy.max_attempts.has_value());
  EXPECT_FALSE(config.retry_policy.deadline.has_value());
}

TEST_F(ClusterPropertiesFlags, Parse) {
  FLAGS_cluster_properties_path = "/cluster/props.json";
  FLAGS_known_cluster_properties = " urlScheme , location,,maxShards ";
  FLAGS_cluster_properties_max_attempts = 5;
  FLAGS_cluster_properties_deadline_ms = 250;

  const auto config = clusterprops::flags::ParseClusterPropertiesConfig();
  EXPECT_EQ(config.path, "/cluster/props.json");
  EXPECT_EQ(config.known_properties, (std::set<std::string, std::less<>>{"location", "maxShards", "urlScheme"}));
  EXPECT_EQ(config.retry_policy.max_attempts, 5U);
  EXPECT_EQ(config.retry_policy.deadline, std::chrono::milliseconds(250));
}

TEST_F(ClusterPropertiesFlags, Validators) {
  EXPECT_TRUE(gflags::SetCommandLineOption("gc_disruption_cron", "0 0 3 * * *").size() > 0);
  EXPECT_TRUE(gflags::SetCommandLineOption("gc_disruption_cron", "every night").empty());
  EXPECT_EQ(FLAGS_gc_disruption_cron, "0 0 3 * * *");

  EXPECT_TRUE(gflags::SetCommandLineOption("cluster_properties_path", "relative.json").empty());
  EXPECT_TRUE(gflags::SetCommandLineOption("log_level", "CHATTY").empty());
}

TEST_F(ClusterPropertiesFlags, RetryBoundsInRange) {
  EXPECT_FALSE(gflags::SetCommandLineOption("cluster_properties_max_attempts", "3").empty());
  EXPECT_TRUE(gflags::SetCommandLineOption("cluster_properties_max_attempts", "2000000").empty());
  EXPECT_EQ(FLAGS_cluster_properties_max_attempts, 3U);

  EXPECT_FALSE(gflags::SetCommandLineOption("cluster_properties_deadline_ms", "1000").empty());
  EXPECT_TRUE(gflags::SetCommandLineOption("cluster_properties_deadline_ms", "3600001").empty());
  EXPECT_EQ(FLAGS_cluster_properties_deadline_ms, 1000U);
}

class LoggerFlags : public ::testing::Test {
 protected:
  void TearDown() override { std::filesystem::remove_all(log_dir_); }

  gflags::FlagSaver saver_;
  std::filesystem::path log_dir_{std::filesystem::temp_directory_path() /
                                 ("unit_flags_log_" + std::to_string(static_cast<int>(getpid())))};
};

TEST_F(LoggerFlags, InitializeLogger) {
  FLAGS_log_level = "DEBUG";
  FLAGS_also_log_to_stderr = false;
  FLAGS_log_file = (log_dir_ / "clusterprops.log").string();

  const auto root = clusterprops::flags::InitializeLogger();
  EXPECT_EQ(spdlog::default_logger(), root);
  EXPECT_EQ(root->name(), "clusterprops");
  EXPECT_EQ(root->level(), spdlog::level::debug);
  EXPECT_EQ(root->sinks().size(), 1U);

  FLAGS_also_log_to_stderr = true;
  FLAGS_log_file = "";
  EXPECT_EQ(clusterprops::flags::InitializeLogger()->sinks().size(), 1U);
}

TEST_F(LoggerFlags, ComponentLoggerSharesSinks) {
  FLAGS_log_level = "ERROR";
  const auto root = clusterprops::flags::InitializeLogger();

  const auto component = clusterprops::flags::ComponentLogger("coordination");
  EXPECT_EQ(component->name(), "clusterprops.coordination");
  EXPECT_EQ(component->level(), spdlog::level::err);
  EXPECT_EQ(component->sinks(), root->sinks());
}
