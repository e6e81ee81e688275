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

#include "disruption/scheduled_disruption.hpp"

#include "utils/logging.hpp"

namespace clusterprops::disruption {

namespace {
constexpr auto kSchedulerThreadName = "disruption";
}  // namespace

ScheduledDisruptionTrigger::ScheduledDisruptionTrigger(std::unique_ptr<Disruption> disruption,
                                                       std::string cron_expression,
                                                       std::shared_ptr<DisruptionSlotAcquirer> slot_acquirer,
                                                       std::shared_ptr<spdlog::logger> logger)
    : disruption_(std::move(disruption)),
      cron_expression_(std::move(cron_expression)),
      slot_acquirer_(std::move(slot_acquirer)),
      logger_(logging::LoggerOrDefault(std::move(logger))) {
  CP_ASSERT(disruption_, "Scheduled disruption needs an action to run");
  try {
    scheduler_.SetInterval(utils::SchedulerInterval::FromCron(cron_expression_));
  } catch (const utils::ParseException &e) {
    throw InvalidScheduleException("Invalid schedule for disruption {}: {}", disruption_->Name(), e.what());
  }
}

ScheduledDisruptionTrigger::~ScheduledDisruptionTrigger() { Cancel(); }

void ScheduledDisruptionTrigger::Start() {
  {
    auto lock = std::lock_guard{state_mutex_};
    if (state_ != State::IDLE) {
      logger_->warn("Disruption {} can't be started while {}", disruption_->Name(), StateToString(state_));
      return;
    }
    state_ = State::SCHEDULED;
  }
  scheduler_.Run(kSchedulerThreadName, utils::Scheduler::Job{[this](auto tick) { Fire(tick); }});
  logger_->info("Disruption {} scheduled with '{}'", disruption_->Name(), cron_expression_);
}

void ScheduledDisruptionTrigger::Cancel() {
  {
    auto lock = std::lock_guard{state_mutex_};
    if (state_ == State::CANCELLED) return;
    state_ = State::CANCELLED;
  }
  // Joins the timer thread, so an in-flight run completes first.
  scheduler_.Stop();
  logger_->info("Disruption {} cancelled", disruption_->Name());
}

ScheduledDisruptionTrigger::State ScheduledDisruptionTrigger::GetState() const {
  auto lock = std::lock_guard{state_mutex_};
  return state_;
}

std::optional<std::chrono::system_clock::time_point> ScheduledDisruptionTrigger::NextExecution() {
  if (GetState() != State::SCHEDULED) return std::nullopt;
  return scheduler_.NextExecution();
}

void ScheduledDisruptionTrigger::Fire(std::chrono::system_clock::time_point tick) {
  {
    auto lock = std::lock_guard{state_mutex_};
    if (state_ != State::SCHEDULED) return;
  }

  if (slot_acquirer_) {
    try {
      if (!slot_acquirer_->TryAcquireSlot(disruption_->Name(), tick)) {
        logger_->debug("Disruption {} runs elsewhere for this tick", disruption_->Name());
        return;
      }
    } catch (const std::exception &e) {
      logger_->warn("Skipping disruption {}, slot acquisition failed: {}", disruption_->Name(), e.what());
      return;
    }
  }

  {
    // Re-checked: Cancel may have raced with slot acquisition.
    auto lock = std::lock_guard{state_mutex_};
    if (state_ != State::SCHEDULED) return;
    state_ = State::RUNNING;
  }

  logger_->info("Running disruption {}", disruption_->Name());
  try {
    disruption_->RunDisruption();
    executions_.fetch_add(1, std::memory_order_acq_rel);
  } catch (const std::exception &e) {
    logger_->error("Disruption {} failed: {}", disruption_->Name(), e.what());
  }

  auto lock = std::lock_guard{state_mutex_};
  if (state_ == State::RUNNING) state_ = State::SCHEDULED;
}

std::string_view StateToString(ScheduledDisruptionTrigger::State state) {
  switch (state) {
    case ScheduledDisruptionTrigger::State::IDLE:
      return "IDLE";
    case ScheduledDisruptionTrigger::State::SCHEDULED:
      return "SCHEDULED";
    case ScheduledDisruptionTrigger::State::RUNNING:
      return "RUNNING";
    case ScheduledDisruptionTrigger::State::CANCELLED:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

}  // namespace clusterprops::disruption
