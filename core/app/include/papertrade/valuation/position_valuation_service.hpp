#pragma once

#include "papertrade/domain/account_snapshot.hpp"
#include "papertrade/domain/position.hpp"
#include "papertrade/scheduler/i_job.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace papertrade {

class AuditLog;
class ITimeProvider;
class Ledger;
class MarketDataCache;

struct ValuationReport {
  std::size_t accounts{0};
  std::size_t positions{0};
  std::size_t stale_positions{0};
  std::size_t failed_accounts{0};
  // Valuations not written because a fill changed the position meanwhile.
  std::size_t superseded_positions{0};
};

// -----------------------------------------------------------------------------
// PositionValuationService — mark-to-market
// -----------------------------------------------------------------------------
//
// @brief  Revalues every open position against cached quotes and appends an
//         AccountSnapshot per account.
//
// @details
// For each position:
//   market_value   = quantity * price
//   unrealized_pnl = (price - average_entry_price) * quantity
// where price is the cached quote when it is within max_quote_age_ms.
// Otherwise the position's last valuation price is kept (falling back to
// the average entry price when it was never valued) and the position is
// flagged stale. A missing quote never aborts the pass.
//
// Each account is read in one consistent view (cash and positions under the
// same lock) so the snapshot cannot mix pre-fill cash with post-fill
// positions. The service writes only PositionValuation fields; quantity,
// average entry price and cash belong to the OrderExecutionEngine.
//
//   total_equity = cash_balance + sum(market_value)
//
// Thread model:
//   runs on the position_valuation job thread. performance() may be called
//   from any thread.
// -----------------------------------------------------------------------------
class PositionValuationService final : public IJob {
 public:
  PositionValuationService(Ledger& ledger, const MarketDataCache& cache,
                           AuditLog& audit, const ITimeProvider& clock,
                           std::int64_t max_quote_age_ms);

  PositionValuationService(const PositionValuationService&) = delete;
  PositionValuationService& operator=(const PositionValuationService&) = delete;

  ValuationReport revalue();

  // Values one account without writing anything. Fills valued_positions
  // (same order as positions) when non-null.
  domain::AccountSnapshot valueAccount(
      const domain::Account& account,
      const std::vector<domain::Position>& positions,
      std::vector<domain::Position>* valued_positions) const;

  // Live performance view of one account. Throws ValidationError for an
  // unknown account.
  domain::AccountPerformance performance(const domain::AccountId& id) const;

  std::string name() const override { return "position_valuation"; }
  JobOutcome tick(const JobContext& context) override;

 private:
  domain::PositionValuation valuePosition(const domain::Position& position,
                                          std::int64_t now_ms) const;

  Ledger& ledger_;
  const MarketDataCache& cache_;
  AuditLog& audit_;
  const ITimeProvider& clock_;
  const std::int64_t max_quote_age_ms_;
};

}  // namespace papertrade
