#pragma once

#include "papertrade/domain/order.hpp"

#include <cstdint>

namespace papertrade {
namespace domain {

using TradeId = std::uint64_t;

// One fill. Append-only: every fill creates exactly one Trade in the same
// atomic step that moves cash and the position. realized_pnl is zero for
// buys.
struct Trade {
  TradeId id{};
  OrderId order_id{};
  AccountId account_id;
  Symbol symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  double realized_pnl{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace papertrade
