#pragma once

#include "papertrade/domain/account.hpp"
#include "papertrade/domain/instrument.hpp"
#include "papertrade/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace papertrade {
namespace domain {

using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// Order terms
// -----------------------------------------------------------------------------
//
// @brief  Kind-specific parameters of an order, one alternative per order
//         kind.
//
// @details
// Each kind carries exactly the price fields it needs, so a market order
// cannot be given a stray limit price and a stop order always has its stop.
// Trigger evaluation dispatches on the active alternative (see
// OrderExecutionEngine::isTriggered), with one evaluation function per kind.
//
//   MarketTerms → fills at the current quote.
//   LimitTerms  → buy when price <= limit, sell when price >= limit.
//   StopTerms   → buy when price >= stop,  sell when price <= stop.
//
// The fill price is always the quote price at the time of execution.
// -----------------------------------------------------------------------------
struct MarketTerms {};

struct LimitTerms {
  double limit_price{0.0};
};

struct StopTerms {
  double stop_price{0.0};
};

using OrderTerms = std::variant<MarketTerms, LimitTerms, StopTerms>;

enum class OrderKind {
  Market,
  Limit,
  Stop,
};

inline OrderKind orderKindOf(const OrderTerms& terms) {
  if (std::holds_alternative<LimitTerms>(terms)) return OrderKind::Limit;
  if (std::holds_alternative<StopTerms>(terms)) return OrderKind::Stop;
  return OrderKind::Market;
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  Full state of one order: the original intent plus its lifecycle
//         status and cumulative fill.
//
// @details
// Created in Pending by OrderExecutionEngine::submitOrder, either for a
// manual request or for a signal-driven request built by the
// StrategySignalEngine (strategy_id set). From then on only the execution
// engine mutates it, under the owning account's lock in the Ledger.
//
// filled_price is the volume-weighted average of all fills so far and stays
// empty until the first fill. filled_at_ms records the most recent fill.
// Copies handed out by queries and events are snapshots.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};
  AccountId account_id;
  Symbol symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  OrderTerms terms{MarketTerms{}};
  OrderStatus status{OrderStatus::Pending};
  std::string status_reason;
  std::int64_t created_at_ms{0};
  std::optional<std::int64_t> filled_at_ms;
  std::optional<double> filled_price;
  double filled_quantity{0.0};
  std::optional<StrategyId> strategy_id;

  double remaining() const { return quantity - filled_quantity; }
};

// Input to OrderExecutionEngine::submitOrder.
struct OrderRequest {
  AccountId account_id;
  Symbol symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  OrderTerms terms{MarketTerms{}};
  std::optional<StrategyId> strategy_id;
};

inline const char* sideToString(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

inline std::optional<Side> sideFromString(const std::string& text) {
  if (text == "BUY") return Side::Buy;
  if (text == "SELL") return Side::Sell;
  return std::nullopt;
}

inline const char* orderKindToString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market: return "MARKET";
    case OrderKind::Limit:  return "LIMIT";
    case OrderKind::Stop:   return "STOP";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace papertrade
