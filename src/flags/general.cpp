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

#include "general.hpp"

#include "utils/exceptions.hpp"
#include "utils/flag_validation.hpp"
#include "utils/scheduler.hpp"
#include "utils/string.hpp"

#include <chrono>
#include <iostream>
#include <string>

// General purpose flags.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(store_directory, "clusterprops_data", "Path to directory in which the coordination store is kept.");

// Cluster properties flags.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(cluster_properties_path, "/clusterprops.json",
                        "Path of the cluster properties document inside the coordination store.", {
                          if (clusterprops::utils::StartsWith(value, "/")) return true;
                          std::cout << "Expected --" << flagname << " to be an absolute path." << std::endl;
                          return false;
                        });
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(known_cluster_properties, "urlScheme,legacyCloud,autoAddReplicas,location,maxCoresPerNode,samplePercentage",
              "Comma separated names of the properties which can be set one at a time.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(cluster_properties_max_attempts, 0,
                        "Maximum number of attempts of a single property update, including the first one. Set to 0 to "
                        "retry until the update succeeds.",
                        FLAG_IN_RANGE(0, 1'000'000));
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_uint64(cluster_properties_deadline_ms, 0,
                        "Time limit in milliseconds for a single property update, retries included. Set to 0 to "
                        "disable.",
                        FLAG_IN_RANGE(0, 3'600'000));

// Disruption flags.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_VALIDATED_string(gc_disruption_cron, "",
                        "Cron expression (seconds first) at which unused memory is returned to the operating system. "
                        "Leave empty to disable.",
                        {
                          if (value.empty()) return true;
                          try {
                            clusterprops::utils::SchedulerInterval::FromCron(value);
                          } catch (const clusterprops::utils::ParseException &e) {
                            std::cout << "Expected --" << flagname << " to be a valid cron expression. " << e.what()
                                      << std::endl;
                            return false;
                          }
                          return true;
                        });

clusterprops::cluster_properties::ClusterPropertiesConfig clusterprops::flags::ParseClusterPropertiesConfig() {
  cluster_properties::ClusterPropertiesConfig config{.path = FLAGS_cluster_properties_path};
  for (const auto name : utils::SplitView(FLAGS_known_cluster_properties, ",")) {
    const auto trimmed = utils::Trim(name);
    if (!trimmed.empty()) config.known_properties.emplace(trimmed);
  }
  if (FLAGS_cluster_properties_max_attempts != 0) {
    config.retry_policy.max_attempts = FLAGS_cluster_properties_max_attempts;
  }
  if (FLAGS_cluster_properties_deadline_ms != 0) {
    config.retry_policy.deadline = std::chrono::milliseconds(FLAGS_cluster_properties_deadline_ms);
  }
  return config;
}
