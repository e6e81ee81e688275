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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/core.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "disruption/garbage_collection.hpp"
#include "disruption/scheduled_disruption.hpp"
#include "disruption/store_slot_acquirer.hpp"
#include "fake_coordination_store.hpp"
#include "utils/synchronized.hpp"

using clusterprops::disruption::Disruption;
using clusterprops::disruption::DisruptionSlotAcquirer;
using clusterprops::disruption::GarbageCollectionDisruption;
using clusterprops::disruption::InvalidScheduleException;
using clusterprops::disruption::ScheduledDisruptionTrigger;
using clusterprops::disruption::StoreSlotAcquirer;
using clusterprops::tests::FakeCoordinationStore;

using State = ScheduledDisruptionTrigger::State;
using testing::_;
using testing::Return;

namespace {
constexpr auto kEverySecond = "* * * * * *";

class CountingDisruption : public Disruption {
 public:
  explicit CountingDisruption(std::chrono::milliseconds duration = std::chrono::milliseconds(0), bool fail = false)
      : duration_(duration), fail_(fail) {}

  std::string_view Name() const override { return "Counting"; }

  void RunDisruption() override {
    started_->fetch_add(1);
    std::this_thread::sleep_for(duration_);
    finished_->fetch_add(1);
    if (fail_) throw std::runtime_error("disruption failed");
  }

  std::shared_ptr<std::atomic<int>> Started() const { return started_; }
  std::shared_ptr<std::atomic<int>> Finished() const { return finished_; }

 private:
  std::chrono::milliseconds duration_;
  bool fail_;
  std::shared_ptr<std::atomic<int>> started_{std::make_shared<std::atomic<int>>(0)};
  std::shared_ptr<std::atomic<int>> finished_{std::make_shared<std::atomic<int>>(0)};
};

class MockSlotAcquirer : public DisruptionSlotAcquirer {
 public:
  MOCK_METHOD(bool, TryAcquireSlot, (std::string_view disruption, std::chrono::system_clock::time_point tick),
              (override));
};

// Records every tick granted by the wrapped acquirer.
class RecordingSlotAcquirer : public DisruptionSlotAcquirer {
 public:
  RecordingSlotAcquirer(std::shared_ptr<DisruptionSlotAcquirer> acquirer,
                        std::shared_ptr<clusterprops::utils::Synchronized<std::multiset<int64_t>>> granted)
      : acquirer_(std::move(acquirer)), granted_(std::move(granted)) {}

  bool TryAcquireSlot(std::string_view disruption, std::chrono::system_clock::time_point tick) override {
    if (!acquirer_->TryAcquireSlot(disruption, tick)) return false;
    granted_->WithLock([tick](auto &granted) {
      granted.insert(std::chrono::duration_cast<std::chrono::seconds>(tick.time_since_epoch()).count());
    });
    return true;
  }

 private:
  std::shared_ptr<DisruptionSlotAcquirer> acquirer_;
  std::shared_ptr<clusterprops::utils::Synchronized<std::multiset<int64_t>>> granted_;
};

std::chrono::system_clock::time_point Tick(int64_t seconds) {
  return std::chrono::system_clock::time_point{std::chrono::seconds(seconds)};
}

template <typename TPredicate>
bool WaitFor(TPredicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!predicate()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}
}  // namespace

TEST(ScheduledDisruptionTrigger, InvalidSchedule) {
  EXPECT_THROW(ScheduledDisruptionTrigger(std::make_unique<CountingDisruption>(), "not a cron"),
               InvalidScheduleException);
  EXPECT_THROW(ScheduledDisruptionTrigger(std::make_unique<CountingDisruption>(), ""), InvalidScheduleException);
  // Plain periods aren't cron expressions.
  EXPECT_THROW(ScheduledDisruptionTrigger(std::make_unique<CountingDisruption>(), "10"), InvalidScheduleException);
}

TEST(ScheduledDisruptionTrigger, IdleUntilStarted) {
  auto disruption = std::make_unique<CountingDisruption>();
  auto started = disruption->Started();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond);

  EXPECT_EQ(trigger.GetState(), State::IDLE);
  EXPECT_EQ(trigger.CronExpression(), kEverySecond);
  EXPECT_FALSE(trigger.NextExecution().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  EXPECT_EQ(*started, 0);
}

TEST(ScheduledDisruptionTrigger, FiresOnSchedule) {
  auto disruption = std::make_unique<CountingDisruption>();
  auto finished = disruption->Finished();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond);

  trigger.Start();
  EXPECT_EQ(trigger.GetState(), State::SCHEDULED);
  const auto next = trigger.NextExecution();
  ASSERT_TRUE(next.has_value());
  EXPECT_LE(*next, std::chrono::system_clock::now() + std::chrono::seconds(1));

  ASSERT_TRUE(WaitFor([&] { return trigger.ExecutionCount() >= 2; }));
  EXPECT_GE(*finished, 2);
  EXPECT_TRUE(WaitFor([&] { return trigger.GetState() == State::SCHEDULED; }));
}

TEST(ScheduledDisruptionTrigger, StartTwiceIsIgnored) {
  ScheduledDisruptionTrigger trigger(std::make_unique<CountingDisruption>(), kEverySecond);
  trigger.Start();
  trigger.Start();
  EXPECT_EQ(trigger.GetState(), State::SCHEDULED);
}

TEST(ScheduledDisruptionTrigger, RunningWhileHookExecutes) {
  auto disruption = std::make_unique<CountingDisruption>(std::chrono::milliseconds(500));
  auto started = disruption->Started();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond);

  trigger.Start();
  ASSERT_TRUE(WaitFor([&] { return *started > 0; }));
  EXPECT_EQ(trigger.GetState(), State::RUNNING);
  EXPECT_FALSE(trigger.NextExecution().has_value());
  ASSERT_TRUE(WaitFor([&] { return trigger.GetState() == State::SCHEDULED; }));
}

TEST(ScheduledDisruptionTrigger, CancelStopsFurtherRuns) {
  auto disruption = std::make_unique<CountingDisruption>();
  auto started = disruption->Started();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond);

  trigger.Start();
  ASSERT_TRUE(WaitFor([&] { return *started > 0; }));
  trigger.Cancel();
  EXPECT_EQ(trigger.GetState(), State::CANCELLED);
  EXPECT_FALSE(trigger.NextExecution().has_value());

  const auto runs = started->load();
  std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  EXPECT_EQ(*started, runs);

  // Cancelled is final.
  trigger.Start();
  EXPECT_EQ(trigger.GetState(), State::CANCELLED);
  ASSERT_NO_THROW(trigger.Cancel());
}

TEST(ScheduledDisruptionTrigger, CancelIdleTrigger) {
  auto disruption = std::make_unique<CountingDisruption>();
  auto started = disruption->Started();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond);

  trigger.Cancel();
  EXPECT_EQ(trigger.GetState(), State::CANCELLED);
  trigger.Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(1500));
  EXPECT_EQ(*started, 0);
}

TEST(ScheduledDisruptionTrigger, CancelWaitsForRunInFlight) {
  auto disruption = std::make_unique<CountingDisruption>(std::chrono::milliseconds(400));
  auto started = disruption->Started();
  auto finished = disruption->Finished();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond);

  trigger.Start();
  ASSERT_TRUE(WaitFor([&] { return *started > 0; }));
  trigger.Cancel();
  EXPECT_EQ(*finished, *started);
  EXPECT_EQ(trigger.GetState(), State::CANCELLED);
}

TEST(ScheduledDisruptionTrigger, FailingHookKeepsSchedule) {
  auto disruption = std::make_unique<CountingDisruption>(std::chrono::milliseconds(0), true);
  auto finished = disruption->Finished();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond);

  trigger.Start();
  ASSERT_TRUE(WaitFor([&] { return *finished >= 2; }));
  EXPECT_EQ(trigger.ExecutionCount(), 0);
  EXPECT_TRUE(WaitFor([&] { return trigger.GetState() == State::SCHEDULED; }));
}

TEST(ScheduledDisruptionTrigger, DeniedSlotSkipsRun) {
  auto acquirer = std::make_shared<MockSlotAcquirer>();
  std::atomic<int> asked{0};
  EXPECT_CALL(*acquirer, TryAcquireSlot(std::string_view{"Counting"}, _)).WillRepeatedly([&asked](auto, auto tick) {
    ++asked;
    EXPECT_EQ(tick, std::chrono::floor<std::chrono::seconds>(tick));
    return false;
  });

  auto disruption = std::make_unique<CountingDisruption>();
  auto started = disruption->Started();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond, acquirer);

  trigger.Start();
  ASSERT_TRUE(WaitFor([&] { return asked >= 2; }));
  trigger.Cancel();
  EXPECT_EQ(*started, 0);
}

TEST(ScheduledDisruptionTrigger, FailingAcquirerSkipsRun) {
  auto acquirer = std::make_shared<MockSlotAcquirer>();
  std::atomic<int> asked{0};
  EXPECT_CALL(*acquirer, TryAcquireSlot(_, _)).WillRepeatedly([&asked](auto, auto) -> bool {
    ++asked;
    throw std::runtime_error("store unavailable");
  });

  auto disruption = std::make_unique<CountingDisruption>();
  auto started = disruption->Started();
  ScheduledDisruptionTrigger trigger(std::move(disruption), kEverySecond, acquirer);

  trigger.Start();
  ASSERT_TRUE(WaitFor([&] { return asked >= 1; }));
  trigger.Cancel();
  EXPECT_EQ(*started, 0);
  EXPECT_EQ(trigger.GetState(), State::CANCELLED);
}

TEST(ScheduledDisruptionTrigger, OneRunPerTickAcrossMembers) {
  FakeCoordinationStore store;
  auto granted = std::make_shared<clusterprops::utils::Synchronized<std::multiset<int64_t>>>();

  auto first_disruption = std::make_unique<CountingDisruption>();
  auto second_disruption = std::make_unique<CountingDisruption>();
  auto first_runs = first_disruption->Finished();
  auto second_runs = second_disruption->Finished();

  ScheduledDisruptionTrigger first(
      std::move(first_disruption), kEverySecond,
      std::make_shared<RecordingSlotAcquirer>(std::make_shared<StoreSlotAcquirer>(store), granted));
  ScheduledDisruptionTrigger second(
      std::move(second_disruption), kEverySecond,
      std::make_shared<RecordingSlotAcquirer>(std::make_shared<StoreSlotAcquirer>(store), granted));

  first.Start();
  second.Start();
  ASSERT_TRUE(WaitFor([&] { return *first_runs + *second_runs >= 3; }, std::chrono::milliseconds(5000)));
  first.Cancel();
  second.Cancel();

  granted->WithLock([&](const auto &ticks) {
    EXPECT_GE(ticks.size(), static_cast<size_t>(*first_runs + *second_runs));
    for (const auto tick : ticks) EXPECT_EQ(ticks.count(tick), 1U) << "tick " << tick;
  });
}

TEST(StoreSlotAcquirer, FirstCreatorWins) {
  FakeCoordinationStore store;
  StoreSlotAcquirer first(store);
  StoreSlotAcquirer second(store);
  const auto tick = std::chrono::system_clock::time_point{std::chrono::seconds(1700000000)};

  EXPECT_TRUE(first.TryAcquireSlot("GarbageCollection", tick));
  EXPECT_FALSE(second.TryAcquireSlot("GarbageCollection", tick));
  EXPECT_FALSE(first.TryAcquireSlot("GarbageCollection", tick));
  const auto slot = store.Get("/disruption_slots/GarbageCollection");
  ASSERT_TRUE(slot.has_value());
  EXPECT_EQ(slot->data, "1700000000");

  EXPECT_TRUE(second.TryAcquireSlot("GarbageCollection", tick + std::chrono::seconds(1)));
  EXPECT_TRUE(second.TryAcquireSlot("Other", tick));
}

TEST(StoreSlotAcquirer, OneNodePerDisruption) {
  FakeCoordinationStore store;
  StoreSlotAcquirer acquirer(store);
  const auto start = std::chrono::system_clock::time_point{std::chrono::seconds(1700000000)};

  for (int i = 0; i < 10; ++i) {
    EXPECT_TRUE(acquirer.TryAcquireSlot("GarbageCollection", start + std::chrono::seconds(i))) << i;
  }
  EXPECT_EQ(store.create_calls, 1);
  EXPECT_EQ(store.write_calls, 9);
  const auto slot = store.Get("/disruption_slots/GarbageCollection");
  ASSERT_TRUE(slot.has_value());
  EXPECT_EQ(slot->data, "1700000009");
  EXPECT_EQ(slot->version, 9);
  EXPECT_FALSE(store.Get("/disruption_slots/GarbageCollection/1700000009").has_value());
}

TEST(StoreSlotAcquirer, OlderTickIsDenied) {
  FakeCoordinationStore store;
  StoreSlotAcquirer acquirer(store);
  const auto tick = std::chrono::system_clock::time_point{std::chrono::seconds(100)};

  EXPECT_TRUE(acquirer.TryAcquireSlot("GarbageCollection", tick));
  EXPECT_FALSE(acquirer.TryAcquireSlot("GarbageCollection", tick - std::chrono::seconds(1)));
  EXPECT_EQ(store.Get("/disruption_slots/GarbageCollection")->data, "100");
}

TEST(StoreSlotAcquirer, ConcurrentClaimDeniesSlot) {
  FakeCoordinationStore store;
  store.Put("/disruption_slots/GarbageCollection", "100");
  StoreSlotAcquirer acquirer(store);
  store.before_write = [&store](std::string_view path) { store.Put(path, "101"); };

  EXPECT_FALSE(acquirer.TryAcquireSlot("GarbageCollection", Tick(101)));
  EXPECT_EQ(store.Get("/disruption_slots/GarbageCollection")->data, "101");
}

TEST(StoreSlotAcquirer, ConcurrentCreateDeniesSlot) {
  FakeCoordinationStore store;
  StoreSlotAcquirer acquirer(store);
  store.before_create = [&store](std::string_view path) { store.Put(path, "7"); };

  EXPECT_FALSE(acquirer.TryAcquireSlot("GarbageCollection", Tick(7)));
}

TEST(StoreSlotAcquirer, InvalidStoredTickIsReclaimed) {
  FakeCoordinationStore store;
  store.Put("/disruption_slots/GarbageCollection", "garbage");
  StoreSlotAcquirer acquirer(store);

  EXPECT_TRUE(acquirer.TryAcquireSlot("GarbageCollection", Tick(5)));
  EXPECT_EQ(store.Get("/disruption_slots/GarbageCollection")->data, "5");
}

TEST(StoreSlotAcquirer, CustomPrefix) {
  FakeCoordinationStore store;
  StoreSlotAcquirer acquirer(store, "/cluster/slots");
  const auto tick = std::chrono::system_clock::time_point{std::chrono::seconds(42)};
  EXPECT_TRUE(acquirer.TryAcquireSlot("GarbageCollection", tick));
  EXPECT_EQ(store.Get("/cluster/slots/GarbageCollection")->data, "42");
}

TEST(StoreSlotAcquirer, StoreFailureDeniesSlot) {
  FakeCoordinationStore store;
  store.connection_lost = true;
  StoreSlotAcquirer acquirer(store);
  EXPECT_FALSE(acquirer.TryAcquireSlot("GarbageCollection", std::chrono::system_clock::now()));
}

TEST(GarbageCollectionDisruption, Run) {
  GarbageCollectionDisruption disruption;
  EXPECT_EQ(disruption.Name(), "GarbageCollection");
  ASSERT_NO_THROW(disruption.RunDisruption());
}

TEST(GarbageCollectionDisruption, LogsOnInjectedLogger) {
  std::ostringstream output;
  auto logger = std::make_shared<spdlog::logger>("gc", std::make_shared<spdlog::sinks::ostream_sink_mt>(output));
  logger->set_pattern("%v");

  GarbageCollectionDisruption disruption(logger);
  disruption.RunDisruption();
  logger->flush();
  EXPECT_THAT(output.str(), testing::HasSubstr("Running memory purge"));
}
