#pragma once

#include "papertrade/domain/account_snapshot.hpp"
#include "papertrade/domain/job_run.hpp"
#include "papertrade/domain/order.hpp"
#include "papertrade/domain/trade.hpp"
#include "papertrade/domain/trading_signal.hpp"

namespace papertrade {

// -----------------------------------------------------------------------------
// Engine events
// -----------------------------------------------------------------------------
//
// @brief  Notifications published on the EventBus after state has been
//         committed to the Ledger or AuditLog.
//
// @details
// Events carry value snapshots, never references into the ledger, so a
// subscriber on another thread can keep them as long as it likes. They are
// published outside every ledger lock.
//
//   JobRunEvent          → every scheduler dispatch (success, failure, skip)
//   SignalEvent          → every strategy evaluation
//   OrderUpdateEvent     → order created or changed status
//   TradeEvent           → a fill was committed
//   AccountSnapshotEvent → an account was revalued
// -----------------------------------------------------------------------------

struct JobRunEvent {
  domain::JobRun run;
};

struct SignalEvent {
  domain::TradingSignal signal;
};

struct OrderUpdateEvent {
  domain::Order order;
  // Status before this update. Equal to order.status for a new order.
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
};

struct TradeEvent {
  domain::Trade trade;
};

struct AccountSnapshotEvent {
  domain::AccountSnapshot snapshot;
};

}  // namespace papertrade
