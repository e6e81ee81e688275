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

#include "memory/global_memory_control.hpp"

#include "utils/logging.hpp"

#if USE_JEMALLOC
#include "jemalloc/jemalloc.h"
#endif

namespace clusterprops::memory {

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define STRINGIFY_HELPER(x) #x
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define STRINGIFY(x) STRINGIFY_HELPER(x)

bool PurgeUnusedMemory() {
#if USE_JEMALLOC
  const auto err = mallctl("arena." STRINGIFY(MALLCTL_ARENAS_ALL) ".purge", nullptr, nullptr, nullptr, 0);
  if (err != 0) {
    spdlog::warn("jemalloc purge failed with error code {}", err);
    return false;
  }
  return true;
#else
  spdlog::debug("Memory purge requested, but the allocator doesn't support it");
  return false;
#endif
}

#undef STRINGIFY
#undef STRINGIFY_HELPER

}  // namespace clusterprops::memory
