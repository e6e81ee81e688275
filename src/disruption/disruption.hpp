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
#include <string_view>

namespace clusterprops::disruption {

/// Deliberately invasive maintenance action run on a schedule.
class Disruption {
 public:
  Disruption() = default;
  Disruption(const Disruption &) = delete;
  Disruption &operator=(const Disruption &) = delete;
  Disruption(Disruption &&) = delete;
  Disruption &operator=(Disruption &&) = delete;
  virtual ~Disruption() = default;

  virtual std::string_view Name() const = 0;
  virtual void RunDisruption() = 0;
};

/// Cluster-wide mutual exclusion for a scheduled tick: among all members that
/// ask for the same `tick`, at most one gets true.
class DisruptionSlotAcquirer {
 public:
  DisruptionSlotAcquirer() = default;
  DisruptionSlotAcquirer(const DisruptionSlotAcquirer &) = delete;
  DisruptionSlotAcquirer &operator=(const DisruptionSlotAcquirer &) = delete;
  DisruptionSlotAcquirer(DisruptionSlotAcquirer &&) = delete;
  DisruptionSlotAcquirer &operator=(DisruptionSlotAcquirer &&) = delete;
  virtual ~DisruptionSlotAcquirer() = default;

  virtual bool TryAcquireSlot(std::string_view disruption, std::chrono::system_clock::time_point tick) = 0;
};

}  // namespace clusterprops::disruption
