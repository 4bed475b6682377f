#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace papertrade {
namespace domain {

using AccountId = std::string;
using StrategyId = int;

// -----------------------------------------------------------------------------
// Account — simulated cash account
// -----------------------------------------------------------------------------
//
// @brief  Holds the cash balance and the automation settings of one paper
//         trading account.
//
// @details
// cash_balance is only ever changed by the OrderExecutionEngine while it
// holds the account's lock inside the Ledger, and it never goes negative.
// realized_pnl accumulates the profit of every closing fill, including
// positions that have since been removed at zero quantity.
//
// strategy_id links the account to at most one Strategy. auto_trade is the
// explicit opt-in that lets the StrategySignalEngine turn signals into
// orders for this account; it is read at order-synthesis time.
// -----------------------------------------------------------------------------
struct Account {
  AccountId id;
  double cash_balance{0.0};
  double initial_cash{0.0};
  double realized_pnl{0.0};
  std::optional<StrategyId> strategy_id;
  bool auto_trade{false};
  bool active{true};
  std::int64_t created_at_ms{0};
};

}  // namespace domain
}  // namespace papertrade
