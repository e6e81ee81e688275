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

#include "utils/scheduler.hpp"

#include <ctime>

#include "croncpp.h"

#include "utils/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/string.hpp"
#include "utils/thread.hpp"

namespace clusterprops::utils {

namespace {
// croncpp works on broken-down time; the expression is evaluated in the local time zone.
Scheduler::time_point CronNext(const cron::cronexpr &cron, const Scheduler::time_point &now) {
  const auto now_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_now{};
  localtime_r(&now_t, &tm_now);
  auto tm_next = cron::cron_next(cron, tm_now);
  tm_next.tm_isdst = -1;
  const auto next_t = std::mktime(&tm_next);
  if (next_t == static_cast<std::time_t>(-1)) return Scheduler::time_point::max();
  return std::chrono::system_clock::from_time_t(next_t);
}
}  // namespace

/**
 * @param f - Function receiving the scheduled execution time. If the function
 * is still running when it should be ran again, it will run right after it
 * finishes its previous run.
 */
void Scheduler::Run(const std::string &service_name, Job f) {
  // stop any running thread
  thread_.request_stop();

  // Thread setup
  thread_ = std::jthread([this, f = std::move(f), service_name = service_name](std::stop_token token) mutable {
    ThreadRun(std::move(service_name), std::move(f), token);
  });
}

void Scheduler::SetInterval(const SchedulerInterval &setup) {
  if (!setup) {  // Un-setup; let the scheduler wait till infinity
    *find_next_.Lock() = [](auto && /* unused */) { return time_point::max(); };
    return;
  }
  *find_next_.Lock() = [cron = cron::make_cron(setup.cron)](const auto &now) { return CronNext(cron, now); };
}

SchedulerInterval SchedulerInterval::FromCron(std::string_view cron_expr) {
  const auto trimmed = utils::Trim(cron_expr);
  if (trimmed.empty()) throw ParseException("Cron expression is empty");
  try {
    (void)cron::make_cron(trimmed);
  } catch (const cron::bad_cronexpr &e) {
    throw ParseException("Invalid cron expression '{}': {}", trimmed, e.what());
  }
  SchedulerInterval interval;
  interval.cron = std::string{trimmed};
  return interval;
}

void Scheduler::ThreadRun(std::string service_name, Job f, std::stop_token token) {
  utils::ThreadSetName(service_name);

  while (true) {
    // First wait then execute the function. Schedulers are started together
    // with the process and there is nothing to do at time zero.
    const auto now = std::chrono::system_clock::now();
    time_point next{};
    {
      auto find_locked = find_next_.Lock();
      DCP_ASSERT(*find_locked, "Scheduler not setup properly");
      next = find_locked->operator()(now);
    }

    {
      auto lk = std::unique_lock{mutex_};
      if (next > now) {
        condition_variable_.wait_until(lk, token, next, [] { return false; });
      }
      if (token.stop_requested()) break;
    }

    f(next);
  }
}

// Concurrent threads may request stopping the scheduler. In that case only one of them will
// actually stop the scheduler, the other one won't. We need to know which one is the successful
// one so that we don't try to join thread concurrently since this could cause undefined behavior.
void Scheduler::Stop() {
  if (thread_.request_stop()) {
    if (thread_.joinable()) thread_.join();
  }
}

}  // namespace clusterprops::utils
