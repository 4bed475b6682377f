#pragma once

#include "papertrade/domain/account.hpp"
#include "papertrade/domain/position.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace papertrade {
namespace domain {

// -----------------------------------------------------------------------------
// AccountSnapshot
// -----------------------------------------------------------------------------
// Point-in-time valuation of one account, appended by the
// PositionValuationService on every revaluation pass.
//
//   total_equity = cash_balance + portfolio_value
//
// where portfolio_value is the sum of market values over the account's open
// positions. stale_positions counts positions priced without a fresh quote.
// -----------------------------------------------------------------------------
struct AccountSnapshot {
  AccountId account_id;
  std::int64_t timestamp_ms{0};
  double cash_balance{0.0};
  double portfolio_value{0.0};
  double total_equity{0.0};
  double unrealized_pnl{0.0};
  double realized_pnl{0.0};
  std::size_t position_count{0};
  std::size_t stale_positions{0};
};

// Performance view served to the query interface: the latest valuation plus
// return figures against the account's starting cash and the valued holdings.
struct AccountPerformance {
  AccountSnapshot summary;
  double initial_cash{0.0};
  double total_pnl{0.0};
  double total_return_percent{0.0};
  std::size_t trade_count{0};
  std::vector<Position> holdings;
};

}  // namespace domain
}  // namespace papertrade
