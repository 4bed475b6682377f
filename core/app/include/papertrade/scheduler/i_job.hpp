#pragma once

#include "papertrade/domain/job_run.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace papertrade {

// What the scheduler tells a job about the tick it is running.
struct JobContext {
  std::int64_t now_ms{0};
  domain::JobTrigger trigger{domain::JobTrigger::Scheduled};
  // Failures in a row before this tick (0 after a success).
  int consecutive_failures{0};
};

// -----------------------------------------------------------------------------
// JobOutcome
// -----------------------------------------------------------------------------
// Returned by IJob::tick(). Item-level problems (one bad symbol, one order
// that errored) are counted in items_failed and do NOT make the tick a
// failure; failed is reserved for the tick as a whole not completing, which
// jobs normally signal by throwing.
// -----------------------------------------------------------------------------
struct JobOutcome {
  bool failed{false};
  std::string error;
  std::size_t items_processed{0};
  std::size_t items_failed{0};
  std::string summary;

  static JobOutcome success(std::size_t processed, std::size_t failed_items,
                            std::string summary) {
    JobOutcome outcome;
    outcome.items_processed = processed;
    outcome.items_failed = failed_items;
    outcome.summary = std::move(summary);
    return outcome;
  }

  static JobOutcome failure(std::string error) {
    JobOutcome outcome;
    outcome.failed = true;
    outcome.error = std::move(error);
    return outcome;
  }
};

// -----------------------------------------------------------------------------
// IJob — unit of periodic work driven by the JobScheduler
// -----------------------------------------------------------------------------
//
// @brief  Interface implemented by the price feed refresher, the order
//         execution engine, the position valuation service and the strategy
//         signal engine.
//
// @details
// tick() performs one bounded pass. The scheduler guarantees that at most
// one tick() of a given job runs at a time, so implementations do not need
// to protect against re-entry of themselves. They do need to tolerate other
// jobs running concurrently and only communicate with them through the
// shared stores (MarketDataCache, Ledger, AuditLog).
//
// Throwing from tick() records a failed JobRun and triggers backoff; it
// never stops the scheduler or other jobs.
// -----------------------------------------------------------------------------
class IJob {
 public:
  virtual ~IJob() = default;

  virtual std::string name() const = 0;

  virtual JobOutcome tick(const JobContext& context) = 0;
};

}  // namespace papertrade
