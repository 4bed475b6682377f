#pragma once

#include "papertrade/domain/job_run.hpp"
#include "papertrade/scheduler/i_job.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace papertrade {

class AuditLog;
class ITimeProvider;
class MarketCalendar;

struct JobSpec {
  std::string name;
  std::int64_t cadence_ms{60'000};
  bool market_hours_only{false};
  // Ticks running longer than this are logged as overruns.
  std::int64_t max_duration_ms{30'000};
  // Upper bound of the failure backoff delay.
  std::int64_t backoff_max_ms{15 * 60'000};
  bool enabled{true};
};

enum class JobState {
  Idle,
  Running,
};

struct JobStatus {
  JobSpec spec;
  JobState state{JobState::Idle};
  std::int64_t next_due_ms{0};
  int consecutive_failures{0};
  std::optional<domain::JobRun> last_run;
};

// -----------------------------------------------------------------------------
// JobScheduler — periodic driver for the engine's jobs
// -----------------------------------------------------------------------------
//
// @brief  Runs each registered IJob on its own cadence, with a market-hours
//         gate, single-flight protection, failure backoff and an audit
//         record for every dispatch.
//
// @details
// Per job:
//   - Single flight: a job is Idle or Running. A dispatch that finds it
//     Running (a slow tick, or a manual run racing a scheduled one) is
//     recorded as Skipped and does nothing.
//   - Market-hours gate: a scheduled dispatch of a market_hours_only job
//     while the MarketCalendar says closed is recorded as Skipped ("market
//     closed") and the job is re-armed for its next cadence. Manual runs
//     are not gated.
//   - Failure isolation: an exception from tick() becomes a Failure JobRun.
//     The scheduler, the other jobs and the failing job's future ticks are
//     unaffected.
//   - Backoff: after n consecutive failures the next scheduled run is
//     delayed by min(cadence * 2^n, backoff_max). A success resets n and the
//     delay to the plain cadence.
//
// Two ways to drive it:
//   start()/stop()  → one worker thread per job. Each worker sleeps on a
//                     condition variable in short slices so stop() returns
//                     promptly and simulated clocks are honoured.
//   runDueJobs()    → dispatches every due job once, in registration order,
//                     on the calling thread. Used by tests and replays with
//                     a SimulationTimeProvider.
//
// Jobs never share a thread, so a slow provider call in price_feed cannot
// delay order_execution.
//
// Ownership:
//   Holds non-owning references to the jobs; they must outlive the
//   scheduler (or at least stop()).
// -----------------------------------------------------------------------------
class JobScheduler {
 public:
  JobScheduler(const ITimeProvider& clock, const MarketCalendar& calendar,
               AuditLog& audit);
  ~JobScheduler();

  JobScheduler(const JobScheduler&) = delete;
  JobScheduler& operator=(const JobScheduler&) = delete;
  JobScheduler(JobScheduler&&) = delete;
  JobScheduler& operator=(JobScheduler&&) = delete;

  // Adds a job, first due immediately. spec.name defaults to job.name().
  // Throws ValidationError for a duplicate name, a non-positive cadence, or
  // when called after start().
  void registerJob(JobSpec spec, IJob& job);

  // Runs the named job now, bypassing cadence and the market-hours gate but
  // not single flight. Throws ValidationError for an unknown name.
  domain::JobRun forceRun(const std::string& name);

  // Dispatches every enabled job whose next run is due. Returns the number
  // of dispatches (including skipped ones).
  std::size_t runDueJobs();

  void start();
  void stop();
  bool running() const { return running_.load(); }

  std::vector<JobStatus> status() const;
  std::optional<JobStatus> status(const std::string& name) const;

  // min(cadence * 2^failures, max(backoff_max, cadence)).
  static std::int64_t backoffDelay(std::int64_t cadence_ms, int failures,
                                   std::int64_t backoff_max_ms);

 private:
  struct JobSlot {
    JobSpec spec;
    IJob* job{nullptr};
    std::atomic<bool> running{false};

    mutable std::mutex state_mutex;
    std::int64_t next_due_ms{0};
    int consecutive_failures{0};
    std::optional<domain::JobRun> last_run;

    std::thread worker;
  };

  JobSlot* findSlot(const std::string& name) const;
  bool isDue(const JobSlot& slot, std::int64_t now_ms) const;
  domain::JobRun dispatch(JobSlot& slot, domain::JobTrigger trigger);
  domain::JobRun skipped(const JobSlot& slot, domain::JobTrigger trigger,
                         std::int64_t now_ms, const std::string& reason);
  void workerLoop(JobSlot& slot);

  const ITimeProvider& clock_;
  const MarketCalendar& calendar_;
  AuditLog& audit_;

  std::vector<std::unique_ptr<JobSlot>> slots_;

  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
};

const char* jobStateToString(JobState state);

}  // namespace papertrade
