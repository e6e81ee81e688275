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

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "coordination/coordination_store_exceptions.hpp"

namespace clusterprops::coordination {

/// Revision of a stored node. A freshly created node has version 0 and every
/// successful write increments it by one.
using Version = int64_t;

struct VersionedData {
  std::string data;
  Version version{0};
};

/// Narrow view of a versioned hierarchical store (ZooKeeper-like). Every call
/// is a blocking round-trip; failures are reported with the exceptions from
/// coordination_store_exceptions.hpp.
class CoordinationStore {
 public:
  /// Receives the current payload (std::nullopt when the node is absent) and
  /// returns the payload to store, or std::nullopt when nothing needs to change.
  using UpdateFunction = std::function<std::optional<std::string>(const std::optional<std::string> &)>;

  /// Retries and node changes are traced on `logger`, the default logger if null.
  explicit CoordinationStore(std::shared_ptr<spdlog::logger> logger = nullptr);
  CoordinationStore(const CoordinationStore &) = delete;
  CoordinationStore &operator=(const CoordinationStore &) = delete;
  CoordinationStore(CoordinationStore &&) = delete;
  CoordinationStore &operator=(CoordinationStore &&) = delete;
  virtual ~CoordinationStore() = default;

  virtual bool Exists(std::string_view path) = 0;

  /// @throw NoNodeException if the node doesn't exist.
  virtual VersionedData Read(std::string_view path) = 0;

  /// Overwrites the node only if its current version equals `expected_version`.
  /// @throw BadVersionException on version mismatch.
  /// @throw NoNodeException if the node doesn't exist.
  virtual void Write(std::string_view path, std::string_view data, Version expected_version) = 0;

  /// @throw NodeExistsException if the node was already created.
  virtual void Create(std::string_view path, std::string_view data) = 0;

  /**
   * Applies `update` to the current payload of `path` and stores the result
   * with a version check, creating the node if it doesn't exist. Version
   * conflicts and concurrent creation are retried transparently, so `update`
   * may be invoked more than once and must not have side effects. Returns
   * without writing if `update` returns std::nullopt.
   *
   * @return true if something was written.
   */
  virtual bool AtomicUpdate(std::string_view path, const UpdateFunction &update);

 protected:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace clusterprops::coordination
