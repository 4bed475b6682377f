// =============================================================================
// job_scheduler_test.cpp
// =============================================================================
// Unit tests for papertrade::JobScheduler.
//
// Validates:
//   - Registration rules and first-run-immediately
//   - Cadence re-arming after a successful run
//   - Market-hours gate skips scheduled runs but not manual ones
//   - Single flight: a second dispatch while running is Skipped
//   - A scheduled skip re-arms the job one cadence out
//   - A throwing job becomes a Failure run and does not affect other jobs
//   - Exponential backoff with a cap, reset on success
//   - Threaded start()/stop()
// =============================================================================

#include "papertrade/common/errors.hpp"
#include "papertrade/eventbus/event_bus.hpp"
#include "papertrade/scheduler/job_scheduler.hpp"
#include "papertrade/storage/audit_log.hpp"
#include "papertrade/time/market_calendar.hpp"
#include "papertrade/time/simulation_time_provider.hpp"

#include "test_times.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

using papertrade::JobSpec;
using papertrade::domain::JobResult;
using papertrade::domain::JobTrigger;

namespace {

class CountingJob final : public papertrade::IJob {
 public:
  explicit CountingJob(std::string name) : name_(std::move(name)) {}

  std::string name() const override { return name_; }

  papertrade::JobOutcome tick(const papertrade::JobContext& /*context*/) override {
    ++ticks;
    if (fail.load()) {
      throw std::runtime_error("provider exploded");
    }
    return papertrade::JobOutcome::success(3, 0, "ok");
  }

  std::atomic<int> ticks{0};
  std::atomic<bool> fail{false};

 private:
  std::string name_;
};

// Blocks inside tick() until release() is called.
class BlockingJob final : public papertrade::IJob {
 public:
  std::string name() const override { return "blocking"; }

  papertrade::JobOutcome tick(const papertrade::JobContext& /*context*/) override {
    std::unique_lock lock(mutex_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return released_; });
    return papertrade::JobOutcome::success(0, 0, "");
  }

  void waitUntilEntered() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return entered_; });
  }

  void release() {
    std::lock_guard lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool entered_{false};
  bool released_{false};
};

JobSpec spec(const std::string& name, std::int64_t cadence_ms,
             bool market_hours_only = false) {
  JobSpec s;
  s.name = name;
  s.cadence_ms = cadence_ms;
  s.market_hours_only = market_hours_only;
  s.backoff_max_ms = 5'000;
  return s;
}

}  // namespace

class JobSchedulerTest : public ::testing::Test {
 protected:
  papertrade::SimulationTimeProvider clock{papertrade::testing::tuesdaySessionMs()};
  papertrade::MarketCalendar calendar;
  papertrade::EventBus bus;
  papertrade::AuditLog audit{bus, 1'000};
  papertrade::JobScheduler scheduler{clock, calendar, audit};
};

TEST_F(JobSchedulerTest, RegistrationRules) {
  CountingJob job("price_feed");
  JobSpec unnamed = spec("", 1'000);
  scheduler.registerJob(unnamed, job);
  ASSERT_TRUE(scheduler.status("price_feed").has_value());

  EXPECT_THROW(scheduler.registerJob(spec("price_feed", 1'000), job),
               papertrade::ValidationError);
  CountingJob other("other");
  EXPECT_THROW(scheduler.registerJob(spec("other", 0), other),
               papertrade::ValidationError);
  EXPECT_THROW(scheduler.forceRun("nope"), papertrade::ValidationError);
}

// -----------------------------------------------------------------------------
// 1. First run is immediate, then the job waits one cadence.
// -----------------------------------------------------------------------------
TEST_F(JobSchedulerTest, RunsOnCadence) {
  CountingJob job("order_execution");
  scheduler.registerJob(spec("order_execution", 5'000), job);

  EXPECT_EQ(scheduler.runDueJobs(), 1u);
  EXPECT_EQ(scheduler.runDueJobs(), 0u);

  clock.advance_by(4'999);
  EXPECT_EQ(scheduler.runDueJobs(), 0u);
  clock.advance_by(1);
  EXPECT_EQ(scheduler.runDueJobs(), 1u);
  EXPECT_EQ(job.ticks.load(), 2);

  auto status = scheduler.status("order_execution");
  ASSERT_TRUE(status->last_run.has_value());
  EXPECT_EQ(status->last_run->outcome, JobResult::Success);
  EXPECT_EQ(status->last_run->items_processed, 3u);
  EXPECT_EQ(status->state, papertrade::JobState::Idle);
  EXPECT_EQ(audit.recentJobRuns(10, "order_execution").size(), 2u);
}

// -----------------------------------------------------------------------------
// 2. Market closed: scheduled runs are skipped and recorded; manual runs go.
// -----------------------------------------------------------------------------
TEST_F(JobSchedulerTest, MarketHoursGate) {
  clock.advance_time(papertrade::testing::saturdayMs());
  CountingJob job("price_feed");
  scheduler.registerJob(spec("price_feed", 60'000, true), job);

  EXPECT_EQ(scheduler.runDueJobs(), 1u);
  EXPECT_EQ(job.ticks.load(), 0);

  auto runs = audit.recentJobRuns(10, "price_feed");
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].outcome, JobResult::Skipped);
  EXPECT_EQ(*runs[0].error, "market closed");
  EXPECT_EQ(scheduler.status("price_feed")->next_due_ms, clock.now_ms() + 60'000);
  EXPECT_EQ(scheduler.runDueJobs(), 0u);

  auto manual = scheduler.forceRun("price_feed");
  EXPECT_EQ(manual.outcome, JobResult::Success);
  EXPECT_EQ(manual.trigger, JobTrigger::Manual);
  EXPECT_EQ(job.ticks.load(), 1);
}

// -----------------------------------------------------------------------------
// 3. A dispatch that finds the job running is skipped, not queued.
// Why: A manual run racing a scheduled one must never execute the same
//      job twice at once.
// -----------------------------------------------------------------------------
TEST_F(JobSchedulerTest, SingleFlightSkipsConcurrentDispatch) {
  BlockingJob job;
  scheduler.registerJob(spec("blocking", 1'000), job);

  std::thread first([this] { scheduler.forceRun("blocking"); });
  job.waitUntilEntered();

  EXPECT_EQ(scheduler.status("blocking")->state, papertrade::JobState::Running);
  auto second = scheduler.forceRun("blocking");
  EXPECT_EQ(second.outcome, JobResult::Skipped);
  EXPECT_EQ(*second.error, "previous run still in progress");

  job.release();
  first.join();

  auto status = scheduler.status("blocking");
  EXPECT_EQ(status->state, papertrade::JobState::Idle);
  EXPECT_EQ(status->last_run->outcome, JobResult::Success);
}

// -----------------------------------------------------------------------------
// 3b. A scheduled dispatch skipped by single flight waits a full cadence
//     before the next attempt instead of retrying while the run is in flight.
// -----------------------------------------------------------------------------
TEST_F(JobSchedulerTest, ScheduledSkipRearmsCadence) {
  BlockingJob job;
  scheduler.registerJob(spec("blocking", 60'000), job);

  std::thread manual([this] { scheduler.forceRun("blocking"); });
  job.waitUntilEntered();

  EXPECT_EQ(scheduler.runDueJobs(), 1u);
  EXPECT_EQ(scheduler.status("blocking")->next_due_ms, clock.now_ms() + 60'000);
  EXPECT_EQ(scheduler.runDueJobs(), 0u);

  job.release();
  manual.join();

  auto runs = audit.recentJobRuns(10, "blocking");
  ASSERT_EQ(runs.size(), 2u);
  std::size_t skipped = 0;
  for (const auto& run : runs) {
    if (run.outcome == JobResult::Skipped) {
      ++skipped;
      EXPECT_EQ(run.trigger, JobTrigger::Scheduled);
    }
  }
  EXPECT_EQ(skipped, 1u);
}

TEST_F(JobSchedulerTest, WorkerDoesNotSpinWhileManualRunHoldsJob) {
  BlockingJob job;
  scheduler.registerJob(spec("blocking", 60'000), job);

  std::thread manual([this] { scheduler.forceRun("blocking"); });
  job.waitUntilEntered();

  scheduler.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  std::size_t skipped = 0;
  for (const auto& run : audit.recentJobRuns(1'000, "blocking")) {
    if (run.outcome == JobResult::Skipped) {
      ++skipped;
    }
  }
  EXPECT_LE(skipped, 1u);

  job.release();
  manual.join();
  scheduler.stop();
}

// -----------------------------------------------------------------------------
// 4. One job throwing does not stop the next one in the same pass.
// -----------------------------------------------------------------------------
TEST_F(JobSchedulerTest, FailureIsIsolated) {
  CountingJob broken("broken");
  CountingJob healthy("healthy");
  broken.fail = true;
  scheduler.registerJob(spec("broken", 1'000), broken);
  scheduler.registerJob(spec("healthy", 1'000), healthy);

  EXPECT_EQ(scheduler.runDueJobs(), 2u);
  EXPECT_EQ(healthy.ticks.load(), 1);

  auto failed = scheduler.status("broken")->last_run;
  EXPECT_EQ(failed->outcome, JobResult::Failure);
  EXPECT_EQ(*failed->error, "provider exploded");
  EXPECT_EQ(scheduler.status("healthy")->last_run->outcome, JobResult::Success);
}

TEST_F(JobSchedulerTest, BackoffGrowsAndResets) {
  CountingJob job("flaky");
  job.fail = true;
  scheduler.registerJob(spec("flaky", 1'000), job);

  scheduler.runDueJobs();
  EXPECT_EQ(scheduler.status("flaky")->consecutive_failures, 1);
  EXPECT_EQ(scheduler.status("flaky")->next_due_ms, clock.now_ms() + 2'000);

  clock.advance_by(1'000);
  EXPECT_EQ(scheduler.runDueJobs(), 0u);
  clock.advance_by(1'000);
  scheduler.runDueJobs();
  EXPECT_EQ(scheduler.status("flaky")->next_due_ms, clock.now_ms() + 4'000);

  clock.advance_by(4'000);
  scheduler.runDueJobs();
  EXPECT_EQ(scheduler.status("flaky")->next_due_ms, clock.now_ms() + 5'000);

  job.fail = false;
  clock.advance_by(5'000);
  scheduler.runDueJobs();
  EXPECT_EQ(scheduler.status("flaky")->consecutive_failures, 0);
  EXPECT_EQ(scheduler.status("flaky")->next_due_ms, clock.now_ms() + 1'000);
}

TEST(JobSchedulerBackoffTest, DelayDoublesUpToCap) {
  using papertrade::JobScheduler;
  EXPECT_EQ(JobScheduler::backoffDelay(1'000, 0, 5'000), 1'000);
  EXPECT_EQ(JobScheduler::backoffDelay(1'000, 1, 5'000), 2'000);
  EXPECT_EQ(JobScheduler::backoffDelay(1'000, 2, 5'000), 4'000);
  EXPECT_EQ(JobScheduler::backoffDelay(1'000, 10, 5'000), 5'000);
  // A cap below the cadence never shortens the cadence.
  EXPECT_EQ(JobScheduler::backoffDelay(1'000, 2, 500), 1'000);
}

// -----------------------------------------------------------------------------
// 5. Worker threads dispatch on their own and stop() joins them.
// -----------------------------------------------------------------------------
TEST_F(JobSchedulerTest, ThreadedStartStop) {
  CountingJob a("a");
  CountingJob b("b");
  scheduler.registerJob(spec("a", 1'000), a);
  scheduler.registerJob(spec("b", 1'000), b);

  scheduler.start();
  EXPECT_TRUE(scheduler.running());
  CountingJob late("late");
  EXPECT_THROW(scheduler.registerJob(spec("late", 1'000), late),
               papertrade::ValidationError);

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while ((a.ticks.load() == 0 || b.ticks.load() == 0) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  scheduler.stop();

  EXPECT_FALSE(scheduler.running());
  EXPECT_EQ(a.ticks.load(), 1);
  EXPECT_EQ(b.ticks.load(), 1);
}
