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

#include "disruption/store_slot_acquirer.hpp"

#include <charconv>
#include <string>
#include <system_error>

#include "utils/logging.hpp"

namespace clusterprops::disruption {

StoreSlotAcquirer::StoreSlotAcquirer(coordination::CoordinationStore &store, std::string prefix,
                                     std::shared_ptr<spdlog::logger> logger)
    : store_(store), prefix_(std::move(prefix)), logger_(logging::LoggerOrDefault(std::move(logger))) {}

bool StoreSlotAcquirer::TryAcquireSlot(std::string_view disruption, std::chrono::system_clock::time_point tick) {
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(tick.time_since_epoch()).count();
  const auto path = fmt::format("{}/{}", prefix_, disruption);
  try {
    if (!Claim(path, seconds)) return false;
    logger_->debug("Acquired {} for tick {}", path, seconds);
    return true;
  } catch (const coordination::CoordinationStoreException &e) {
    logger_->warn("Couldn't acquire {} for tick {}: {}", path, seconds, e.what());
    return false;
  }
}

bool StoreSlotAcquirer::Claim(const std::string &path, int64_t tick) {
  coordination::VersionedData current;
  try {
    current = store_.Read(path);
  } catch (const coordination::NoNodeException &) {
    try {
      store_.Create(path, std::to_string(tick));
      return true;
    } catch (const coordination::NodeExistsException &) {
      return false;
    }
  }

  // An unreadable tick is treated as older than any tick.
  int64_t granted = 0;
  const auto &data = current.data;
  if (const auto [ptr, ec] = std::from_chars(data.data(), data.data() + data.size(), granted);
      ec != std::errc{} || ptr != data.data() + data.size()) {
    logger_->warn("Slot {} holds an invalid tick '{}'", path, data);
    granted = 0;
  }
  if (granted >= tick) return false;

  try {
    store_.Write(path, std::to_string(tick), current.version);
    return true;
  } catch (const coordination::BadVersionException &) {
    return false;
  } catch (const coordination::NoNodeException &) {
    return false;
  }
}

}  // namespace clusterprops::disruption
