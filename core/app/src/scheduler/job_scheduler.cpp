#include "papertrade/scheduler/job_scheduler.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/storage/audit_log.hpp"
#include "papertrade/time/i_time_provider.hpp"
#include "papertrade/time/market_calendar.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace papertrade {

namespace {

// Longest a worker sleeps before re-reading the clock. Bounds both stop()
// latency and how late a job notices a simulated clock jump.
constexpr std::int64_t kMaxIdleWaitMs = 50;

// Clears the single-flight flag however dispatch() exits.
class RunningGuard {
 public:
  explicit RunningGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~RunningGuard() { flag_.store(false); }

  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

}  // namespace

const char* jobStateToString(JobState state) {
  return state == JobState::Running ? "RUNNING" : "IDLE";
}

JobScheduler::JobScheduler(const ITimeProvider& clock, const MarketCalendar& calendar,
                           AuditLog& audit)
    : clock_(clock), calendar_(calendar), audit_(audit) {}

JobScheduler::~JobScheduler() { stop(); }

std::int64_t JobScheduler::backoffDelay(std::int64_t cadence_ms, int failures,
                                        std::int64_t backoff_max_ms) {
  const std::int64_t cap = std::max(backoff_max_ms, cadence_ms);
  std::int64_t delay = cadence_ms;
  for (int i = 0; i < failures && delay < cap; ++i) {
    delay *= 2;
  }
  return std::min(delay, cap);
}

void JobScheduler::registerJob(JobSpec spec, IJob& job) {
  if (running_.load()) {
    throw ValidationError("cannot register jobs while the scheduler is running");
  }
  if (spec.name.empty()) {
    spec.name = job.name();
  }
  if (spec.cadence_ms <= 0) {
    throw ValidationError("job " + spec.name + ": cadence must be positive");
  }
  if (findSlot(spec.name) != nullptr) {
    throw ValidationError("job already registered: " + spec.name);
  }

  auto slot = std::make_unique<JobSlot>();
  slot->spec = std::move(spec);
  slot->job = &job;
  slot->next_due_ms = clock_.now_ms();
  slots_.push_back(std::move(slot));
}

JobScheduler::JobSlot* JobScheduler::findSlot(const std::string& name) const {
  for (const auto& slot : slots_) {
    if (slot->spec.name == name) {
      return slot.get();
    }
  }
  return nullptr;
}

bool JobScheduler::isDue(const JobSlot& slot, std::int64_t now_ms) const {
  if (!slot.spec.enabled) {
    return false;
  }
  std::lock_guard lock(slot.state_mutex);
  return now_ms >= slot.next_due_ms;
}

domain::JobRun JobScheduler::skipped(const JobSlot& slot, domain::JobTrigger trigger,
                                     std::int64_t now_ms, const std::string& reason) {
  domain::JobRun run;
  run.job_name = slot.spec.name;
  run.trigger = trigger;
  run.started_at_ms = now_ms;
  run.finished_at_ms = now_ms;
  run.outcome = domain::JobResult::Skipped;
  run.error = reason;
  audit_.recordJobRun(run);
  return run;
}

// -----------------------------------------------------------------------------
// dispatch()
// -----------------------------------------------------------------------------
// Idle → Running is a compare-exchange on the slot flag; losing the race
// means another dispatch of the same job is in flight.
// -----------------------------------------------------------------------------
domain::JobRun JobScheduler::dispatch(JobSlot& slot, domain::JobTrigger trigger) {
  bool expected = false;
  if (!slot.running.compare_exchange_strong(expected, true)) {
    std::cerr << "[JobScheduler] WARNING: " << slot.spec.name
              << " still running, " << domain::jobTriggerToString(trigger)
              << " run skipped\n";
    const std::int64_t now = clock_.now_ms();
    if (trigger == domain::JobTrigger::Scheduled) {
      // One skip per due tick: the next scheduled attempt is a cadence away.
      std::lock_guard lock(slot.state_mutex);
      slot.next_due_ms = now + slot.spec.cadence_ms;
    }
    return skipped(slot, trigger, now, "previous run still in progress");
  }
  RunningGuard guard(slot.running);

  const std::int64_t started = clock_.now_ms();
  if (trigger == domain::JobTrigger::Scheduled && slot.spec.market_hours_only &&
      !calendar_.isOpen(started)) {
    {
      std::lock_guard lock(slot.state_mutex);
      slot.next_due_ms = started + slot.spec.cadence_ms;
    }
    return skipped(slot, trigger, started, "market closed");
  }

  JobContext context;
  context.now_ms = started;
  context.trigger = trigger;
  {
    std::lock_guard lock(slot.state_mutex);
    context.consecutive_failures = slot.consecutive_failures;
  }

  const auto wall_start = std::chrono::steady_clock::now();
  JobOutcome outcome;
  try {
    outcome = slot.job->tick(context);
  } catch (const std::exception& e) {
    outcome = JobOutcome::failure(e.what());
  }
  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - wall_start)
                              .count();
  if (elapsed_ms > slot.spec.max_duration_ms) {
    std::cerr << "[JobScheduler] WARNING: " << slot.spec.name << " took "
              << elapsed_ms << "ms (limit " << slot.spec.max_duration_ms << "ms)\n";
  }

  domain::JobRun run;
  run.job_name = slot.spec.name;
  run.trigger = trigger;
  run.started_at_ms = started;
  run.finished_at_ms = clock_.now_ms();
  run.outcome = outcome.failed ? domain::JobResult::Failure : domain::JobResult::Success;
  if (outcome.failed) {
    run.error = outcome.error;
  }
  run.items_processed = outcome.items_processed;
  run.items_failed = outcome.items_failed;
  run.summary = outcome.summary;

  int failures = 0;
  std::int64_t delay = slot.spec.cadence_ms;
  {
    std::lock_guard lock(slot.state_mutex);
    if (outcome.failed) {
      failures = ++slot.consecutive_failures;
      delay = backoffDelay(slot.spec.cadence_ms, failures, slot.spec.backoff_max_ms);
    } else {
      slot.consecutive_failures = 0;
    }
    slot.next_due_ms = *run.finished_at_ms + delay;
    slot.last_run = run;
  }

  if (outcome.failed) {
    std::cerr << "[JobScheduler] ERROR: " << slot.spec.name << " failed ("
              << failures << " in a row): " << outcome.error << ". Next attempt in "
              << delay << "ms\n";
  }

  audit_.recordJobRun(run);
  return run;
}

domain::JobRun JobScheduler::forceRun(const std::string& name) {
  JobSlot* slot = findSlot(name);
  if (slot == nullptr) {
    throw ValidationError("unknown job: " + name);
  }
  std::cout << "[JobScheduler] manual run of " << name << "\n";
  return dispatch(*slot, domain::JobTrigger::Manual);
}

std::size_t JobScheduler::runDueJobs() {
  std::size_t dispatched = 0;
  for (const auto& slot : slots_) {
    if (isDue(*slot, clock_.now_ms())) {
      dispatch(*slot, domain::JobTrigger::Scheduled);
      ++dispatched;
    }
  }
  return dispatched;
}

// -----------------------------------------------------------------------------
// Threaded mode
// -----------------------------------------------------------------------------
void JobScheduler::workerLoop(JobSlot& slot) {
  while (running_.load()) {
    const std::int64_t now = clock_.now_ms();
    if (isDue(slot, now)) {
      dispatch(slot, domain::JobTrigger::Scheduled);
      continue;
    }

    std::int64_t remaining = kMaxIdleWaitMs;
    {
      std::lock_guard lock(slot.state_mutex);
      remaining = slot.next_due_ms - now;
    }
    const auto wait = std::chrono::milliseconds(std::clamp<std::int64_t>(remaining, 1, kMaxIdleWaitMs));

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, wait, [this] { return !running_.load(); });
  }
}

void JobScheduler::start() {
  if (running_.exchange(true)) {
    return;
  }
  for (auto& slot : slots_) {
    JobSlot* raw = slot.get();
    raw->worker = std::thread([this, raw] { workerLoop(*raw); });
  }
  std::cout << "[JobScheduler] started " << slots_.size() << " job thread(s)\n";
}

void JobScheduler::stop() {
  const bool was_running = running_.exchange(false);
  {
    std::lock_guard lock(wake_mutex_);
  }
  wake_cv_.notify_all();
  for (auto& slot : slots_) {
    if (slot->worker.joinable()) {
      slot->worker.join();
    }
  }
  if (was_running) {
    std::cout << "[JobScheduler] stopped\n";
  }
}

std::vector<JobStatus> JobScheduler::status() const {
  std::vector<JobStatus> result;
  result.reserve(slots_.size());
  for (const auto& slot : slots_) {
    JobStatus entry;
    entry.spec = slot->spec;
    entry.state = slot->running.load() ? JobState::Running : JobState::Idle;
    std::lock_guard lock(slot->state_mutex);
    entry.next_due_ms = slot->next_due_ms;
    entry.consecutive_failures = slot->consecutive_failures;
    entry.last_run = slot->last_run;
    result.push_back(std::move(entry));
  }
  return result;
}

std::optional<JobStatus> JobScheduler::status(const std::string& name) const {
  for (auto& entry : status()) {
    if (entry.spec.name == name) {
      return entry;
    }
  }
  return std::nullopt;
}

}  // namespace papertrade
