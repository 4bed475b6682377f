#pragma once

#include "papertrade/domain/account_snapshot.hpp"
#include "papertrade/domain/job_run.hpp"
#include "papertrade/domain/order.hpp"
#include "papertrade/domain/trade.hpp"
#include "papertrade/domain/trading_signal.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace papertrade {

class EventBus;

// -----------------------------------------------------------------------------
// AuditLog — append-only operational records
// -----------------------------------------------------------------------------
//
// @brief  Stores JobRuns, TradingSignals and AccountSnapshots, and forwards
//         every record (plus order and trade notifications) to the EventBus.
//
// @details
// Each record kind is kept in its own bounded deque; once capacity is
// reached the oldest entry is evicted. Snapshots are bounded per account.
// Records are immutable once appended.
//
// Publishing happens after the record is stored and after the internal lock
// is released, so subscribers may query the log from their callback.
//
// Thread model:
//   std::shared_mutex. Writers (job threads) take it exclusively for one
//   push; query readers take it shared.
// -----------------------------------------------------------------------------
class AuditLog {
 public:
  AuditLog(EventBus& event_bus, std::size_t capacity);

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  void recordJobRun(const domain::JobRun& run);
  void recordSignal(const domain::TradingSignal& signal);
  void recordSnapshot(const domain::AccountSnapshot& snapshot);

  // Notifications only; orders and trades are stored by the Ledger.
  void publishOrderUpdate(const domain::Order& order,
                          domain::OrderStatus previous_status);
  void publishTrade(const domain::Trade& trade);

  // Most recent first. An empty job_name matches every job.
  std::vector<domain::JobRun> recentJobRuns(std::size_t limit,
                                            const std::string& job_name = {}) const;
  std::vector<domain::TradingSignal> recentSignals(
      std::size_t limit,
      std::optional<domain::StrategyId> strategy_id = std::nullopt) const;
  std::vector<domain::AccountSnapshot> snapshots(const domain::AccountId& id,
                                                 std::size_t limit) const;
  std::optional<domain::AccountSnapshot> latestSnapshot(
      const domain::AccountId& id) const;

  std::size_t jobRunCount() const;
  std::size_t signalCount() const;

 private:
  template <typename T>
  void appendBounded(std::deque<T>& records, const T& record);

  EventBus& event_bus_;
  const std::size_t capacity_;

  mutable std::shared_mutex mutex_;
  std::deque<domain::JobRun> job_runs_;
  std::deque<domain::TradingSignal> signals_;
  std::map<domain::AccountId, std::deque<domain::AccountSnapshot>> snapshots_;
};

}  // namespace papertrade
