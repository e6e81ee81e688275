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

#include <memory>

#include <spdlog/logger.h>

#include "disruption/disruption.hpp"

namespace clusterprops::disruption {

/// Forces the allocator to hand unused memory back to the operating system.
class GarbageCollectionDisruption final : public Disruption {
 public:
  explicit GarbageCollectionDisruption(std::shared_ptr<spdlog::logger> logger = nullptr);

  std::string_view Name() const override { return "GarbageCollection"; }
  void RunDisruption() override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace clusterprops::disruption
