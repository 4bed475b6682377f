#pragma once

#include "papertrade/domain/strategy.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace papertrade {

// -----------------------------------------------------------------------------
// StrategyRepository — strategy reference data
// -----------------------------------------------------------------------------
// Loaded from configuration at startup. The StrategySignalEngine reads it on
// every tick; upsert() exists for administrative reloads and validates the
// parameters before storing (ConfigError on nonsense such as a short window
// that is not shorter than the long one).
// -----------------------------------------------------------------------------
class StrategyRepository {
 public:
  StrategyRepository() = default;
  explicit StrategyRepository(const std::vector<domain::Strategy>& strategies);

  StrategyRepository(const StrategyRepository&) = delete;
  StrategyRepository& operator=(const StrategyRepository&) = delete;

  void upsert(domain::Strategy strategy);

  std::optional<domain::Strategy> find(domain::StrategyId id) const;
  std::vector<domain::Strategy> all() const;
  std::vector<domain::Strategy> active() const;

  // Union of every active strategy's universe, sorted and de-duplicated.
  std::vector<domain::Symbol> universeSymbols() const;

  static void validate(const domain::Strategy& strategy);

 private:
  mutable std::shared_mutex mutex_;
  std::map<domain::StrategyId, domain::Strategy> strategies_;
};

}  // namespace papertrade
