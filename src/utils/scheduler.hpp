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
#include <condition_variable>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "utils/synchronized.hpp"

namespace clusterprops::utils {

/// Cron schedule (six fields, seconds first). A default constructed interval
/// never fires.
struct SchedulerInterval {
  SchedulerInterval() = default;

  /// @throw ParseException if `cron_expr` can't be parsed.
  static SchedulerInterval FromCron(std::string_view cron_expr);

  friend bool operator==(const SchedulerInterval &lrh, const SchedulerInterval &rhs) = default;

  explicit operator bool() const { return !cron.empty(); }

  std::string cron{};
};

/**
 * Class used to run scheduled function execution.
 */
class Scheduler {
 public:
  using time_point = std::chrono::system_clock::time_point;
  /// Job receives the time point it was scheduled for.
  using Job = std::function<void(time_point)>;

  Scheduler() = default;
  void Run(const std::string &service_name, Job f);

  void SetInterval(const SchedulerInterval &setup);

  void Stop();

  std::optional<time_point> NextExecution() {
    const auto next = find_next_.WithLock([](auto &f) { return f(std::chrono::system_clock::now()); });
    return next != time_point::max() ? std::make_optional(next) : std::nullopt;
  }

  ~Scheduler() { Stop(); }

 private:
  void ThreadRun(std::string service_name, Job f, std::stop_token token);

  Synchronized<std::function<time_point(const time_point &)>> find_next_{
      [](auto && /* unused */) { return time_point::max(); }};  // default to infinity

  /**
   * Mutex used to synchronize threads using condition variable.
   */
  std::mutex mutex_;

  /**
   * Condition variable is used to stop waiting until the end of the
   * time interval if destructor is called.
   */
  std::condition_variable_any condition_variable_;

  /**
   * Thread which runs function.
   */
  std::jthread thread_;
};

}  // namespace clusterprops::utils
