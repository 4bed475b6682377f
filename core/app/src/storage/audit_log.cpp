#include "papertrade/storage/audit_log.hpp"

#include "papertrade/eventbus/event_bus.hpp"

#include <algorithm>
#include <mutex>

namespace papertrade {

AuditLog::AuditLog(EventBus& event_bus, std::size_t capacity)
    : event_bus_(event_bus), capacity_(std::max<std::size_t>(capacity, 1)) {}

template <typename T>
void AuditLog::appendBounded(std::deque<T>& records, const T& record) {
  records.push_back(record);
  while (records.size() > capacity_) {
    records.pop_front();
  }
}

void AuditLog::recordJobRun(const domain::JobRun& run) {
  {
    std::unique_lock lock(mutex_);
    appendBounded(job_runs_, run);
  }
  event_bus_.publish(JobRunEvent{run});
}

void AuditLog::recordSignal(const domain::TradingSignal& signal) {
  {
    std::unique_lock lock(mutex_);
    appendBounded(signals_, signal);
  }
  event_bus_.publish(SignalEvent{signal});
}

void AuditLog::recordSnapshot(const domain::AccountSnapshot& snapshot) {
  {
    std::unique_lock lock(mutex_);
    appendBounded(snapshots_[snapshot.account_id], snapshot);
  }
  event_bus_.publish(AccountSnapshotEvent{snapshot});
}

void AuditLog::publishOrderUpdate(const domain::Order& order,
                                  domain::OrderStatus previous_status) {
  event_bus_.publish(OrderUpdateEvent{order, previous_status});
}

void AuditLog::publishTrade(const domain::Trade& trade) {
  event_bus_.publish(TradeEvent{trade});
}

std::vector<domain::JobRun> AuditLog::recentJobRuns(
    std::size_t limit, const std::string& job_name) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::JobRun> result;
  for (auto it = job_runs_.rbegin(); it != job_runs_.rend() && result.size() < limit; ++it) {
    if (job_name.empty() || it->job_name == job_name) {
      result.push_back(*it);
    }
  }
  return result;
}

std::vector<domain::TradingSignal> AuditLog::recentSignals(
    std::size_t limit, std::optional<domain::StrategyId> strategy_id) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::TradingSignal> result;
  for (auto it = signals_.rbegin(); it != signals_.rend() && result.size() < limit; ++it) {
    if (!strategy_id || it->strategy_id == *strategy_id) {
      result.push_back(*it);
    }
  }
  return result;
}

std::vector<domain::AccountSnapshot> AuditLog::snapshots(
    const domain::AccountId& id, std::size_t limit) const {
  std::shared_lock lock(mutex_);
  auto it = snapshots_.find(id);
  if (it == snapshots_.end()) {
    return {};
  }
  const auto& history = it->second;
  std::vector<domain::AccountSnapshot> result;
  for (auto s = history.rbegin(); s != history.rend() && result.size() < limit; ++s) {
    result.push_back(*s);
  }
  return result;
}

std::optional<domain::AccountSnapshot> AuditLog::latestSnapshot(
    const domain::AccountId& id) const {
  std::shared_lock lock(mutex_);
  auto it = snapshots_.find(id);
  if (it == snapshots_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.back();
}

std::size_t AuditLog::jobRunCount() const {
  std::shared_lock lock(mutex_);
  return job_runs_.size();
}

std::size_t AuditLog::signalCount() const {
  std::shared_lock lock(mutex_);
  return signals_.size();
}

}  // namespace papertrade
