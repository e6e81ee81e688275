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

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "coordination/coordination_store.hpp"
#include "disruption/disruption.hpp"

namespace clusterprops::disruption {

inline constexpr std::string_view kDisruptionSlotsPath = "/disruption_slots";

/**
 * Each disruption owns a single node, `<prefix>/<disruption>`, holding the last
 * granted tick in epoch seconds. A tick is granted to the member whose create,
 * or version checked write of a newer tick, succeeds. Store failures deny the
 * slot: skipping one run is preferable to running it twice.
 */
class StoreSlotAcquirer final : public DisruptionSlotAcquirer {
 public:
  explicit StoreSlotAcquirer(coordination::CoordinationStore &store,
                             std::string prefix = std::string{kDisruptionSlotsPath},
                             std::shared_ptr<spdlog::logger> logger = nullptr);

  bool TryAcquireSlot(std::string_view disruption, std::chrono::system_clock::time_point tick) override;

 private:
  bool Claim(const std::string &path, int64_t tick);

  coordination::CoordinationStore &store_;
  std::string prefix_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace clusterprops::disruption
