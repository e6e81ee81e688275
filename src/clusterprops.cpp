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

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <fmt/chrono.h>
#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include "cluster_properties/cluster_properties.hpp"
#include "coordination/kvstore_coordination_store.hpp"
#include "disruption/garbage_collection.hpp"
#include "disruption/scheduled_disruption.hpp"
#include "disruption/store_slot_acquirer.hpp"
#include "flags/general.hpp"
#include "flags/log_level.hpp"
#include "utils/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/signals.hpp"

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_bool(list, false, "Print the whole cluster properties document.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(get, "", "Print the value at the given property path, e.g. 'defaults/collection/numShards'.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(default, "", "Value printed by --get when the property isn't set.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(set, "", "Name of a known property to set to --value.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(value, "", "Value used by --set.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(unset, "", "Name of a known property to remove.");
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
DEFINE_string(merge, "", "JSON object merged into the document. Null values remove keys.");

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t is_shutting_down = 0;

void InitSignalHandlers() {
  // Block the other shutdown signal while one is being handled.
  sigset_t block_shutdown_signals;
  sigemptyset(&block_shutdown_signals);
  sigaddset(&block_shutdown_signals, SIGTERM);
  sigaddset(&block_shutdown_signals, SIGINT);

  auto shutdown = []() { is_shutting_down = 1; };

  CP_ASSERT(clusterprops::utils::SignalHandler::RegisterHandler(clusterprops::utils::Signal::Terminate, shutdown,
                                                                block_shutdown_signals),
            "Unable to register SIGTERM handler!");
  CP_ASSERT(clusterprops::utils::SignalHandler::RegisterHandler(clusterprops::utils::Signal::Interrupt, shutdown,
                                                                block_shutdown_signals),
            "Unable to register SIGINT handler!");
}

bool IsSet(const char *flag) { return !gflags::GetCommandLineFlagInfoOrDie(flag).is_default; }

int RunCommand(clusterprops::cluster_properties::ClusterPropertiesClient &client) {
  namespace cp = clusterprops::cluster_properties;

  if (FLAGS_list) {
    std::cout << cp::EncodeDocument(client.GetProperties()) << std::endl;
    return 0;
  }

  if (!FLAGS_get.empty()) {
    const auto value = client.GetProperty(FLAGS_get);
    if (!value) {
      if (!IsSet("default")) {
        spdlog::warn("Cluster property {} isn't set", FLAGS_get);
        return 1;
      }
      std::cout << FLAGS_default << std::endl;
    } else if (value->is_string()) {
      std::cout << value->get<std::string>() << std::endl;
    } else {
      std::cout << value->dump(2) << std::endl;
    }
    return 0;
  }

  if (!FLAGS_set.empty()) {
    if (!IsSet("value")) {
      spdlog::error("--set requires --value");
      return 1;
    }
    client.SetProperty(FLAGS_set, FLAGS_value);
    spdlog::info("Cluster property {} set to {}", FLAGS_set, FLAGS_value);
    return 0;
  }

  if (!FLAGS_unset.empty()) {
    client.SetProperty(FLAGS_unset, std::nullopt);
    spdlog::info("Cluster property {} removed", FLAGS_unset);
    return 0;
  }

  if (!FLAGS_merge.empty()) {
    const auto written = client.SetProperties(cp::DecodeDocument(FLAGS_merge));
    if (written) {
      spdlog::info("Cluster properties updated");
    } else {
      spdlog::info("Cluster properties already up to date");
    }
    return 0;
  }

  return -1;
}

void RunGarbageCollectionDisruption(clusterprops::coordination::CoordinationStore &store) {
  namespace disruption = clusterprops::disruption;

  auto logger = clusterprops::flags::ComponentLogger("disruption");
  disruption::ScheduledDisruptionTrigger trigger(
      std::make_unique<disruption::GarbageCollectionDisruption>(logger), FLAGS_gc_disruption_cron,
      std::make_shared<disruption::StoreSlotAcquirer>(store, std::string{disruption::kDisruptionSlotsPath}, logger),
      logger);
  InitSignalHandlers();
  trigger.Start();
  if (const auto next = trigger.NextExecution(); next) {
    spdlog::info("Garbage collection disruption scheduled at '{}', next run at {:%Y-%m-%d %H:%M:%S}",
                 trigger.CronExpression(), std::chrono::floor<std::chrono::seconds>(*next));
  }

  while (!is_shutting_down) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  trigger.Cancel();
  spdlog::info("Garbage collection disruption stopped after {} run(s)", trigger.ExecutionCount());
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage(
      "Inspect and modify the cluster properties document.\n"
      "Commands: --list, --get=<path> [--default=<v>], --set=<name> --value=<v>, --unset=<name>, "
      "--merge=<json>, --gc_disruption_cron=<cron>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  clusterprops::flags::InitializeLogger();

  std::unique_ptr<clusterprops::coordination::KVStoreCoordinationStore> store_ptr;
  try {
    store_ptr = std::make_unique<clusterprops::coordination::KVStoreCoordinationStore>(
        FLAGS_store_directory, clusterprops::flags::ComponentLogger("coordination"));
  } catch (const clusterprops::kvstore::KVStoreError &e) {
    LOG_FATAL("Couldn't open the coordination store in {}: {}", FLAGS_store_directory, e.what());
  }
  auto &store = *store_ptr;

  try {
    clusterprops::cluster_properties::ClusterPropertiesClient client(
        store, clusterprops::flags::ParseClusterPropertiesConfig(),
        clusterprops::flags::ComponentLogger("cluster_properties"));

    const auto result = RunCommand(client);
    if (result >= 0) return result;

    if (!FLAGS_gc_disruption_cron.empty()) {
      RunGarbageCollectionDisruption(store);
      return 0;
    }
  } catch (const clusterprops::utils::BasicException &e) {
    spdlog::error("{}: {}", e.name(), e.what());
    return 1;
  }

  gflags::ShowUsageWithFlagsRestrict(argv[0], "clusterprops.cpp");
  return 1;
}
