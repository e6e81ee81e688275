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

#include <unistd.h>

#include <fstream>

#include <gtest/gtest.h>

#include "kvstore/kvstore.hpp"
#include "utils/file.hpp"

namespace fs = std::filesystem;

class KVStore : public ::testing::Test {
 protected:
  void SetUp() override { clusterprops::utils::EnsureDir(test_folder_); }

  void TearDown() override { clusterprops::utils::DeleteDir(test_folder_); }

  fs::path test_folder_{fs::temp_directory_path() /
                        ("unit_kvstore_test_" + std::to_string(static_cast<int>(getpid())))};
};

TEST_F(KVStore, GetMissing) {
  clusterprops::kvstore::KVStore kvstore(test_folder_ / "GetMissing");
  ASSERT_FALSE(kvstore.Get("key").has_value());
}

TEST_F(KVStore, PutMultipleGet) {
  clusterprops::kvstore::KVStore kvstore(test_folder_ / "PutMultipleGet");
  ASSERT_TRUE(kvstore.PutMultiple({{"key1", "value1"}, {"key2", "value2"}}));
  ASSERT_EQ(kvstore.Get("key1").value(), "value1");
  ASSERT_EQ(kvstore.Get("key2").value(), "value2");
}

TEST_F(KVStore, PutMultipleOverwrite) {
  clusterprops::kvstore::KVStore kvstore(test_folder_ / "PutMultipleOverwrite");
  ASSERT_TRUE(kvstore.PutMultiple({{"key1", "value1"}}));
  ASSERT_TRUE(kvstore.PutMultiple({{"key1", "value2"}, {"key2", ""}}));
  ASSERT_EQ(kvstore.Get("key1").value(), "value2");
  ASSERT_EQ(kvstore.Get("key2").value(), "");
}

TEST_F(KVStore, Durability) {
  {
    clusterprops::kvstore::KVStore kvstore(test_folder_ / "Durability");
    ASSERT_TRUE(kvstore.PutMultiple({{"key", "value"}}));
  }
  {
    clusterprops::kvstore::KVStore kvstore(test_folder_ / "Durability");
    ASSERT_EQ(kvstore.Get("key").value(), "value");
  }
}

TEST_F(KVStore, MoveConstruct) {
  clusterprops::kvstore::KVStore first(test_folder_ / "MoveConstruct");
  ASSERT_TRUE(first.PutMultiple({{"key", "value"}}));
  clusterprops::kvstore::KVStore second(std::move(first));
  ASSERT_EQ(second.Get("key").value(), "value");
}

TEST_F(KVStore, UnusableDirectory) {
  const auto file = test_folder_ / "file";
  { std::ofstream{file} << "not a directory"; }
  ASSERT_THROW(clusterprops::kvstore::KVStore kvstore(file / "db"), clusterprops::kvstore::KVStoreError);
}
