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

#include "coordination/kvstore_coordination_store.hpp"

#include <charconv>
#include <map>

#include "utils/logging.hpp"

namespace clusterprops::coordination {

namespace {
constexpr std::string_view kDataPrefix = "data:";
constexpr std::string_view kVersionPrefix = "version:";

std::string DataKey(std::string_view path) { return fmt::format("{}{}", kDataPrefix, path); }
std::string VersionKey(std::string_view path) { return fmt::format("{}{}", kVersionPrefix, path); }
}  // namespace

KVStoreCoordinationStore::KVStoreCoordinationStore(std::filesystem::path storage,
                                                   std::shared_ptr<spdlog::logger> logger)
    : CoordinationStore(std::move(logger)), storage_(std::move(storage)) {}

std::optional<Version> KVStoreCoordinationStore::CurrentVersion(std::string_view path) const {
  std::optional<std::string> stored;
  try {
    stored = storage_.Get(VersionKey(path));
  } catch (const kvstore::KVStoreError &e) {
    throw CoordinationStoreException("Couldn't read node {}: {}", path, e.what());
  }
  if (!stored) return std::nullopt;

  Version version{0};
  const auto *end = stored->data() + stored->size();
  const auto [ptr, ec] = std::from_chars(stored->data(), end, version);
  if (ec != std::errc{} || ptr != end) {
    throw CoordinationStoreException("Corrupted version '{}' stored for node {}", *stored, path);
  }
  return version;
}

void KVStoreCoordinationStore::Store(std::string_view path, std::string_view data, Version version) {
  const std::map<std::string, std::string> items{{DataKey(path), std::string{data}},
                                                 {VersionKey(path), std::to_string(version)}};
  rocksdb::WriteOptions options;
  options.sync = true;
  if (!storage_.PutMultiple(items, options)) {
    throw CoordinationStoreException("Couldn't persist node {} at version {}", path, version);
  }
}

bool KVStoreCoordinationStore::Exists(std::string_view path) {
  auto lock = std::lock_guard{mutex_};
  return CurrentVersion(path).has_value();
}

VersionedData KVStoreCoordinationStore::Read(std::string_view path) {
  auto lock = std::lock_guard{mutex_};
  const auto version = CurrentVersion(path);
  if (!version) throw NoNodeException(path);

  std::optional<std::string> data;
  try {
    data = storage_.Get(DataKey(path));
  } catch (const kvstore::KVStoreError &e) {
    throw CoordinationStoreException("Couldn't read node {}: {}", path, e.what());
  }
  if (!data) throw CoordinationStoreException("Node {} has a version but no payload", path);
  return VersionedData{.data = std::move(*data), .version = *version};
}

void KVStoreCoordinationStore::Write(std::string_view path, std::string_view data, Version expected_version) {
  auto lock = std::lock_guard{mutex_};
  const auto version = CurrentVersion(path);
  if (!version) throw NoNodeException(path);
  if (*version != expected_version) throw BadVersionException(path, expected_version, *version);
  Store(path, data, *version + 1);
  logger_->trace("Node {} written at version {}", path, *version + 1);
}

void KVStoreCoordinationStore::Create(std::string_view path, std::string_view data) {
  auto lock = std::lock_guard{mutex_};
  if (CurrentVersion(path)) throw NodeExistsException(path);
  Store(path, data, 0);
  logger_->trace("Node {} created", path);
}

}  // namespace clusterprops::coordination
