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

namespace clusterprops::utils {

/**
 * Ensures that the given directory either exists after this call or that it
 * already existed. Returns false when the path is taken by something that
 * isn't a directory or when the directory can't be created.
 */
bool EnsureDir(const std::filesystem::path &dir) noexcept;

/// Removes the directory and everything below it. Returns false on error.
bool DeleteDir(const std::filesystem::path &dir) noexcept;

}  // namespace clusterprops::utils
