#pragma once

#include "papertrade/domain/account.hpp"
#include "papertrade/domain/instrument.hpp"

#include <cstdint>
#include <optional>

namespace papertrade {
namespace domain {

// -----------------------------------------------------------------------------
// PositionValuation — mark-to-market fields of a position
// -----------------------------------------------------------------------------
// Written only by the PositionValuationService. Kept in its own struct so
// that the execution path (which owns quantity and average entry price) and
// the valuation path never write the same fields.
//
// stale is set when last_price did not come from a fresh quote (no quote in
// the cache, or the cached quote exceeded the freshness limit).
// -----------------------------------------------------------------------------
struct PositionValuation {
  double last_price{0.0};
  double market_value{0.0};
  double unrealized_pnl{0.0};
  std::int64_t priced_at_ms{0};
  bool stale{false};
};

// -----------------------------------------------------------------------------
// Position — long holding of one instrument in one account
// -----------------------------------------------------------------------------
//
// @brief  Quantity and cost basis of a holding.
//
// @details
// Positions are long-only: quantity is strictly positive while the position
// exists. A sell that brings quantity to zero removes the position from the
// account; its realized profit has already been credited to the account.
//
// average_entry_price is the weighted average of all buy fills:
//   new_avg = (old_qty * old_avg + fill_qty * fill_price) / (old_qty + fill_qty)
// and is unchanged by sells. Each sell realizes
//   fill_qty * (fill_price - average_entry_price).
//
// Thread model:
//   The authoritative copy lives in the Ledger under the account's lock.
//   Every accessor hands out copies.
// -----------------------------------------------------------------------------
struct Position {
  AccountId account_id;
  Symbol symbol;
  double quantity{0.0};
  double average_entry_price{0.0};
  double realized_pnl{0.0};
  std::optional<PositionValuation> valuation;
};

// Quantities below this are treated as zero when closing positions.
constexpr double kQuantityEpsilon = 1e-9;

}  // namespace domain
}  // namespace papertrade
