#pragma once

#include <optional>
#include <string>

namespace papertrade {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state an order can occupy between submission and its final
//         outcome.
//
// @details
// Legal transitions:
//
//   Pending ──────────> PartiallyFilled ──> Filled
//     │   │                │   │   ▲
//     │   │                │   │   └── (more partial fills)
//     │   └──> Filled      │   └──> Cancelled
//     ├──> Cancelled       └──> Rejected
//     └──> Rejected
//
// Terminal states: Filled, Cancelled, Rejected. An order in a terminal state
// never changes again; the OrderExecutionEngine re-checks this under the
// account lock before applying any fill, so a duplicate attempt is a no-op.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,          // Accepted, waiting for its trigger and a fresh quote
  PartiallyFilled,  // Some quantity filled, remainder still working
  Filled,           // Terminal
  Cancelled,        // Terminal
  Rejected,         // Terminal, status_reason says why
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled || status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected;
}

// Returns true when moving from current to next is allowed by the state
// machine above.
inline bool isLegalTransition(OrderStatus current, OrderStatus next) {
  switch (current) {
    case OrderStatus::Pending:
      return next == OrderStatus::PartiallyFilled ||
             next == OrderStatus::Filled || next == OrderStatus::Cancelled ||
             next == OrderStatus::Rejected;
    case OrderStatus::PartiallyFilled:
      return next == OrderStatus::PartiallyFilled ||
             next == OrderStatus::Filled || next == OrderStatus::Cancelled ||
             next == OrderStatus::Rejected;
    case OrderStatus::Filled:
    case OrderStatus::Cancelled:
    case OrderStatus::Rejected:
      return false;
  }
  return false;
}

inline const char* orderStatusToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:         return "PENDING";
    case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    case OrderStatus::Filled:          return "FILLED";
    case OrderStatus::Cancelled:       return "CANCELLED";
    case OrderStatus::Rejected:        return "REJECTED";
  }
  return "UNKNOWN";
}

inline std::optional<OrderStatus> orderStatusFromString(const std::string& text) {
  if (text == "PENDING") return OrderStatus::Pending;
  if (text == "PARTIALLY_FILLED") return OrderStatus::PartiallyFilled;
  if (text == "FILLED") return OrderStatus::Filled;
  if (text == "CANCELLED") return OrderStatus::Cancelled;
  if (text == "REJECTED") return OrderStatus::Rejected;
  return std::nullopt;
}

}  // namespace domain
}  // namespace papertrade
