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

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "coordination/coordination_store.hpp"
#include "kvstore/kvstore.hpp"

namespace clusterprops::coordination {

/**
 * Coordination store kept in a local RocksDB instance. Suitable for a single
 * host where every writer shares this object; compare-and-swap is serialized
 * with an in-process mutex. Node payload and version are written in one batch
 * so a crash never leaves them out of sync.
 */
class KVStoreCoordinationStore final : public CoordinationStore {
 public:
  /// @throw kvstore::KVStoreError if the storage directory can't be opened.
  explicit KVStoreCoordinationStore(std::filesystem::path storage, std::shared_ptr<spdlog::logger> logger = nullptr);

  bool Exists(std::string_view path) override;
  VersionedData Read(std::string_view path) override;
  void Write(std::string_view path, std::string_view data, Version expected_version) override;
  void Create(std::string_view path, std::string_view data) override;

 private:
  std::optional<Version> CurrentVersion(std::string_view path) const;
  void Store(std::string_view path, std::string_view data, Version version);

  kvstore::KVStore storage_;
  std::mutex mutex_;
};

}  // namespace clusterprops::coordination
