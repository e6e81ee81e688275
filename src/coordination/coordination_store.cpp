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

#include "coordination/coordination_store.hpp"

#include "utils/logging.hpp"

namespace clusterprops::coordination {

CoordinationStore::CoordinationStore(std::shared_ptr<spdlog::logger> logger)
    : logger_(logging::LoggerOrDefault(std::move(logger))) {}

bool CoordinationStore::AtomicUpdate(std::string_view path, const UpdateFunction &update) {
  while (true) {
    if (Exists(path)) {
      VersionedData current;
      try {
        current = Read(path);
      } catch (const NoNodeException &) {
        // Removed between the existence check and the read.
        continue;
      }
      auto modified = update(current.data);
      if (!modified) return false;
      try {
        Write(path, *modified, current.version);
        return true;
      } catch (const BadVersionException &e) {
        logger_->trace("Retrying update of {}: {}", path, e.what());
        continue;
      } catch (const NoNodeException &) {
        continue;
      }
    }

    auto created = update(std::nullopt);
    if (!created) return false;
    try {
      Create(path, *created);
      return true;
    } catch (const NodeExistsException &e) {
      logger_->trace("Retrying update of {}: {}", path, e.what());
    }
  }
}

}  // namespace clusterprops::coordination
