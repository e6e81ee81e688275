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
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "cluster_properties/cluster_properties_exceptions.hpp"
#include "cluster_properties/property_document.hpp"
#include "coordination/coordination_store.hpp"

namespace clusterprops::cluster_properties {

inline constexpr std::string_view kClusterPropertiesPath = "/clusterprops.json";

/// Bounds for the single-key retry loop. Unset fields mean unbounded, which is
/// the default: conflicts are retried until the write goes through.
struct RetryPolicy {
  /// Total attempts including the first one.
  std::optional<uint64_t> max_attempts;
  /// Measured from the start of the call; checked before every retry.
  std::optional<std::chrono::milliseconds> deadline;
};

struct ClusterPropertiesConfig {
  std::string path{kClusterPropertiesPath};
  /// Names accepted by SetProperty. Bulk updates aren't restricted.
  std::set<std::string, std::less<>> known_properties;
  RetryPolicy retry_policy{};
};

/**
 * Reads and mutates the cluster-wide property document kept at a single path
 * of the coordination store. Writers never lock: every mutation reads the
 * current revision and writes back conditioned on its version, repeating the
 * cycle when another writer got there first.
 *
 * Every call goes to the store; nothing is cached. Callers that can live with
 * eventually consistent values should keep their own read-through copy.
 */
class ClusterPropertiesClient {
 public:
  ClusterPropertiesClient(coordination::CoordinationStore &store, ClusterPropertiesConfig config,
                          std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * Value addressed by `key` (see GetByPath), or std::nullopt if it isn't set.
   * @throw ClusterPropertiesIOException, PropertyDecodeException
   */
  std::optional<PropertyDocument> GetProperty(std::string_view key) const;

  /**
   * Typed lookup returning `default_value` when the property isn't set.
   * @throw PropertyDecodeException if the stored value can't be converted to T.
   */
  template <typename T>
  T GetProperty(std::string_view key, T default_value) const {
    auto value = GetProperty(key);
    if (!value) return default_value;
    try {
      return value->template get<T>();
    } catch (const PropertyDocument::exception &e) {
      throw PropertyDecodeException("Cluster property {} has an unexpected type: {}", key, e.what());
    }
  }

  std::string GetProperty(std::string_view key, const char *default_value) const {
    return GetProperty<std::string>(key, std::string{default_value});
  }

  /**
   * The whole document. A missing document reads as an empty one.
   * @throw ClusterPropertiesIOException, PropertyDecodeException
   */
  PropertyDocument GetProperties() const;

  /**
   * Merges `properties` into the stored document (see MergeInto) and writes
   * the result unless nothing changed.
   *
   * @return true if the document was written.
   * @throw InvalidPropertyUpdateException if `properties` isn't an object.
   * @throw ClusterPropertiesIOException, PropertyDecodeException
   */
  bool SetProperties(const PropertyDocument &properties);

  /**
   * Sets a single known property, or removes it when `value` is std::nullopt.
   * Nothing is written when the document already holds the requested state.
   *
   * @throw UnknownPropertyException before touching the store if `name` isn't known.
   * @throw ClusterPropertiesIOException, PropertyDecodeException
   * @throw RetriesExhaustedException, RetryTimeoutException when the retry policy is bounded.
   */
  void SetProperty(std::string_view name, std::optional<std::string> value);

  bool IsKnownProperty(std::string_view name) const { return config_.known_properties.contains(name); }

 private:
  // One read-decide-write cycle. Conflicts propagate as store exceptions.
  void TrySetProperty(const std::string &name, const std::optional<std::string> &value);
  void CheckRetryBudget(std::string_view name, uint64_t attempt, std::chrono::steady_clock::time_point started) const;

  coordination::CoordinationStore &store_;
  ClusterPropertiesConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace clusterprops::cluster_properties
