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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "disruption/disruption.hpp"
#include "utils/exceptions.hpp"
#include "utils/scheduler.hpp"

namespace clusterprops::disruption {

class InvalidScheduleException final : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidScheduleException)
};

/**
 * Runs a Disruption at every fire time of a cron expression.
 *
 * The trigger doesn't coordinate with other cluster members by itself; when a
 * DisruptionSlotAcquirer is given, the hook only runs on ticks for which the
 * acquirer grants the slot.
 *
 * Idle --Start--> Scheduled --fire--> Running --done--> Scheduled
 * Idle, Scheduled, Running --Cancel--> Cancelled
 *
 * After Cancel no new run starts; a run already in flight is allowed to
 * finish and Cancel waits for it.
 */
class ScheduledDisruptionTrigger {
 public:
  enum class State : uint8_t { IDLE, SCHEDULED, RUNNING, CANCELLED };

  /// @throw InvalidScheduleException if `cron_expression` can't be parsed.
  ScheduledDisruptionTrigger(std::unique_ptr<Disruption> disruption, std::string cron_expression,
                             std::shared_ptr<DisruptionSlotAcquirer> slot_acquirer = nullptr,
                             std::shared_ptr<spdlog::logger> logger = nullptr);

  ScheduledDisruptionTrigger(const ScheduledDisruptionTrigger &) = delete;
  ScheduledDisruptionTrigger &operator=(const ScheduledDisruptionTrigger &) = delete;
  ScheduledDisruptionTrigger(ScheduledDisruptionTrigger &&) = delete;
  ScheduledDisruptionTrigger &operator=(ScheduledDisruptionTrigger &&) = delete;

  ~ScheduledDisruptionTrigger();

  /// Starts the timer. Ignored unless Idle.
  void Start();

  /// Stops the timer for good. Safe to call repeatedly and from any thread
  /// other than the one running the hook.
  void Cancel();

  State GetState() const;

  std::optional<std::chrono::system_clock::time_point> NextExecution();

  const std::string &CronExpression() const { return cron_expression_; }

  uint64_t ExecutionCount() const { return executions_.load(std::memory_order_acquire); }

 private:
  void Fire(std::chrono::system_clock::time_point tick);

  std::unique_ptr<Disruption> disruption_;
  std::string cron_expression_;
  std::shared_ptr<DisruptionSlotAcquirer> slot_acquirer_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex state_mutex_;
  State state_{State::IDLE};
  std::atomic<uint64_t> executions_{0};

  // Last member so the timer thread is joined before anything it touches goes away.
  utils::Scheduler scheduler_;
};

std::string_view StateToString(ScheduledDisruptionTrigger::State state);

}  // namespace clusterprops::disruption
