#pragma once

#include "papertrade/domain/order.hpp"
#include "papertrade/domain/position.hpp"
#include "papertrade/domain/quote.hpp"
#include "papertrade/execution/fill_policy.hpp"
#include "papertrade/scheduler/i_job.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace papertrade {

class AuditLog;
class ITimeProvider;
class Ledger;
class MarketDataCache;

// Outcome of one attempt to execute one order.
enum class FillResult {
  Filled,            // Fully filled, order is terminal
  PartiallyFilled,   // Some quantity filled, order still working
  Rejected,          // Insufficient cash or holdings, order is terminal
  NotTriggered,      // Limit/stop condition not met, stays pending
  QuoteUnavailable,  // No cached quote, stays pending
  QuoteStale,        // Cached quote older than the freshness limit
  AlreadyTerminal,   // Order reached a terminal state elsewhere, no-op
};

const char* fillResultToString(FillResult result);

struct ExecutionSettings {
  // Quotes older than this are not executed against.
  std::int64_t max_quote_age_ms{5 * 60 * 1000};
};

struct ExecutionReport {
  std::size_t examined{0};
  std::size_t filled{0};
  std::size_t partially_filled{0};
  std::size_t rejected{0};
  std::size_t waiting{0};
  std::size_t errors{0};
};

// -----------------------------------------------------------------------------
// OrderExecutionEngine — simulated matching of pending orders
// -----------------------------------------------------------------------------
//
// @brief  Sole owner of order state transitions. Accepts new orders, cancels
//         working ones and, on every tick, fills the pending orders whose
//         conditions are met against cached quotes.
//
// @details
// Per tick, orders are taken from the Ledger in ascending id (submission
// order) and each one is evaluated independently:
//
//   1. A quote must be cached and no older than max_quote_age_ms, otherwise
//      the order simply stays pending.
//   2. The order's trigger is evaluated for its kind (see isTriggered).
//   3. The fill policy decides the quantity for this pass.
//   4. The fill is committed atomically under the account's lock: the order
//      status is re-checked (a terminal order is left untouched), cash or
//      holdings are re-checked against the fill, and then cash, position,
//      trade and order are all updated together, or the order is rejected
//      with a reason and nothing else changes.
//
// Because of the re-check in step 4, attempting the same fill twice (a
// duplicate tick, a manual force-run racing a scheduled one) can never
// produce a second trade.
//
// Position arithmetic:
//   buy : avg = (qty * avg + fill_qty * price) / (qty + fill_qty)
//   sell: realized = fill_qty * (price - avg); qty -= fill_qty; a position at
//         zero quantity is removed and its realized profit stays on the
//         account.
//
// An exception while processing one order is logged and counted; the pass
// continues. A StorageUnavailableError aborts the whole tick.
//
// Thread model:
//   runs on the order_execution job thread. submitOrder/cancelOrder may be
//   called from any thread (IPC, strategy engine); they go through the same
//   per-account lock as fills.
// -----------------------------------------------------------------------------
class OrderExecutionEngine final : public IJob {
 public:
  OrderExecutionEngine(Ledger& ledger, const MarketDataCache& cache,
                       AuditLog& audit, const ITimeProvider& clock,
                       std::unique_ptr<IFillPolicy> fill_policy,
                       ExecutionSettings settings = {});

  OrderExecutionEngine(const OrderExecutionEngine&) = delete;
  OrderExecutionEngine& operator=(const OrderExecutionEngine&) = delete;

  // Validates and stores a new Pending order. Throws ValidationError for an
  // unknown or inactive account, a non-positive quantity, a missing or
  // non-positive limit/stop price or an empty symbol.
  domain::Order submitOrder(domain::OrderRequest request);

  // Cancels a Pending or PartiallyFilled order. Returns false when the order
  // is unknown or already terminal.
  bool cancelOrder(domain::OrderId id, const std::string& reason = "cancelled by request");

  // One matching pass over every non-terminal order.
  ExecutionReport runPass();

  // Evaluates and, when possible, fills one order. order may be a stale
  // snapshot; the authoritative state is re-read under the lock.
  FillResult processOrder(const domain::Order& order);

  // Trigger condition for the order's kind at the given price.
  static bool isTriggered(const domain::Order& order, double price);

  // Applies a fill to a long position. Returns the realized profit (zero for
  // buys). The caller guarantees a sell never exceeds the held quantity.
  static double applyFillToPosition(domain::Position& position, domain::Side side,
                                    double quantity, double price);

  const IFillPolicy& fillPolicy() const { return *fill_policy_; }

  std::string name() const override { return "order_execution"; }
  JobOutcome tick(const JobContext& context) override;

 private:
  static bool evaluateMarket(const domain::MarketTerms& terms, domain::Side side,
                             double price);
  static bool evaluateLimit(const domain::LimitTerms& terms, domain::Side side,
                            double price);
  static bool evaluateStop(const domain::StopTerms& terms, domain::Side side,
                           double price);

  FillResult commitFill(const domain::Order& snapshot, double quantity,
                        double price);

  Ledger& ledger_;
  const MarketDataCache& cache_;
  AuditLog& audit_;
  const ITimeProvider& clock_;
  std::unique_ptr<IFillPolicy> fill_policy_;
  const ExecutionSettings settings_;
};

}  // namespace papertrade
