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

#include "cluster_properties/cluster_properties.hpp"

#include "utils/logging.hpp"

namespace clusterprops::cluster_properties {

ClusterPropertiesClient::ClusterPropertiesClient(coordination::CoordinationStore &store,
                                                 ClusterPropertiesConfig config,
                                                 std::shared_ptr<spdlog::logger> logger)
    : store_(store), config_(std::move(config)), logger_(logging::LoggerOrDefault(std::move(logger))) {}

std::optional<PropertyDocument> ClusterPropertiesClient::GetProperty(std::string_view key) const {
  return GetByPath(GetProperties(), key);
}

PropertyDocument ClusterPropertiesClient::GetProperties() const {
  try {
    return DecodeDocument(store_.Read(config_.path).data);
  } catch (const coordination::NoNodeException &) {
    return PropertyDocument::object();
  } catch (const coordination::CoordinationStoreException &e) {
    throw ClusterPropertiesIOException("Error reading cluster properties: {}", e.what());
  }
}

bool ClusterPropertiesClient::SetProperties(const PropertyDocument &properties) {
  if (!properties.is_object()) {
    throw InvalidPropertyUpdateException("Cluster properties update must be a JSON object, got {}",
                                         properties.type_name());
  }

  auto merge = [&properties](const std::optional<std::string> &current) -> std::optional<std::string> {
    // An absent document takes the update as is, minus nulls: there is nothing for them to remove, and
    // storing them would leave keys that read as unset.
    if (!current) return EncodeDocument(MergeDocuments(PropertyDocument::object(), properties).merged);
    auto document = DecodeDocument(*current);
    if (!MergeInto(document, properties)) return std::nullopt;
    return EncodeDocument(document);
  };

  try {
    const auto written = store_.AtomicUpdate(config_.path, merge);
    if (written) {
      logger_->debug("Cluster properties at {} updated", config_.path);
    } else {
      logger_->trace("Cluster properties at {} already up to date", config_.path);
    }
    return written;
  } catch (const coordination::CoordinationStoreException &e) {
    throw ClusterPropertiesIOException("Error updating cluster properties: {}", e.what());
  }
}

void ClusterPropertiesClient::SetProperty(std::string_view name, std::optional<std::string> value) {
  if (!IsKnownProperty(name)) {
    throw UnknownPropertyException(name);
  }

  const std::string property_name{name};
  const auto started = std::chrono::steady_clock::now();
  for (uint64_t attempt = 1;; ++attempt) {
    if (attempt > 1) CheckRetryBudget(name, attempt, started);
    try {
      TrySetProperty(property_name, value);
      return;
    } catch (const coordination::BadVersionException &e) {
      logger_->debug("Concurrent update of cluster property {}, retrying: {}", name, e.what());
    } catch (const coordination::NodeExistsException &e) {
      logger_->debug("Concurrent update of cluster property {}, retrying: {}", name, e.what());
    } catch (const coordination::NoNodeException &e) {
      // Removed between the existence check and the read or write.
      logger_->debug("Concurrent update of cluster property {}, retrying: {}", name, e.what());
    } catch (const coordination::CoordinationStoreException &e) {
      throw ClusterPropertiesIOException("Error setting cluster property {}: {}", name, e.what());
    }
  }
}

void ClusterPropertiesClient::TrySetProperty(const std::string &name, const std::optional<std::string> &value) {
  if (!store_.Exists(config_.path)) {
    if (!value) return;  // Nothing to remove
    auto properties = PropertyDocument::object();
    properties[name] = *value;
    store_.Create(config_.path, EncodeDocument(properties));
    logger_->debug("Cluster properties created at {} with {}", config_.path, name);
    return;
  }

  auto current = store_.Read(config_.path);
  auto properties = DecodeDocument(current.data);
  if (!value) {
    // Don't update the store unless absolutely necessary.
    if (!properties.contains(name)) return;
    properties.erase(name);
  } else {
    auto it = properties.find(name);
    if (it != properties.end() && it->is_string() && it->get_ref<const std::string &>() == *value) return;
    properties[name] = *value;
  }
  store_.Write(config_.path, EncodeDocument(properties), current.version);
  logger_->debug("Cluster property {} {} at version {}", name, value ? "set" : "removed", current.version + 1);
}

void ClusterPropertiesClient::CheckRetryBudget(std::string_view name, uint64_t attempt,
                                               std::chrono::steady_clock::time_point started) const {
  const auto &policy = config_.retry_policy;
  if (policy.max_attempts && attempt > *policy.max_attempts) {
    throw RetriesExhaustedException("Cluster property {} not set after {} attempts", name, attempt - 1);
  }
  if (policy.deadline && std::chrono::steady_clock::now() - started >= *policy.deadline) {
    throw RetryTimeoutException("Cluster property {} not set within {} ms", name, policy.deadline->count());
  }
}

}  // namespace clusterprops::cluster_properties
