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

#include "disruption/garbage_collection.hpp"

#include "memory/global_memory_control.hpp"
#include "utils/logging.hpp"

namespace clusterprops::disruption {

GarbageCollectionDisruption::GarbageCollectionDisruption(std::shared_ptr<spdlog::logger> logger)
    : logger_(logging::LoggerOrDefault(std::move(logger))) {}

void GarbageCollectionDisruption::RunDisruption() {
  logger_->info("Running memory purge");
  if (!memory::PurgeUnusedMemory()) {
    logger_->info("Allocator did not release any memory");
  }
}

}  // namespace clusterprops::disruption
