// Copyright 2024 Memgraph Ltd.
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

#include <rocksdb/options.h>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "utils/exceptions.hpp"

namespace clusterprops::kvstore {

class KVStoreError : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(KVStoreError)
};

/**
 * RocksDB database kept in a single directory. Thread safe; durability of a
 * write is controlled through the WriteOptions passed with it.
 */
class KVStore final {
 public:
  KVStore() = delete;

  /**
   * @param storage Path to a directory where the data is persisted.
   *
   * NOTE: Don't instantiate more instances of a KVStore with the same
   *       storage directory because that will lead to undefined behaviour.
   */
  explicit KVStore(std::filesystem::path storage);

  KVStore(const KVStore &other) = delete;
  KVStore(KVStore &&other);

  KVStore &operator=(const KVStore &other) = delete;
  KVStore &operator=(KVStore &&other);

  ~KVStore();

  /**
   * Store values under the given keys in a single atomic write batch.
   *
   * @return true if all of the items have been stored, false if none has.
   */
  bool PutMultiple(const std::map<std::string, std::string> &items, rocksdb::WriteOptions options = {});

  /**
   * Retrieve value for the given key.
   *
   * @return Value for the given key or std::nullopt if the key doesn't exist.
   * @throw KVStoreError if the underlying storage failed to answer.
   */
  std::optional<std::string> Get(std::string_view key, rocksdb::ReadOptions options = {}) const;

 private:
  struct impl;
  std::unique_ptr<impl> pimpl_;
};

}  // namespace clusterprops::kvstore
