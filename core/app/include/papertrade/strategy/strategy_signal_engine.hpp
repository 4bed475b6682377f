#pragma once

#include "papertrade/concurrent/id_generator.hpp"
#include "papertrade/domain/account.hpp"
#include "papertrade/domain/strategy.hpp"
#include "papertrade/domain/trading_signal.hpp"
#include "papertrade/scheduler/i_job.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace papertrade {

class AuditLog;
class IMarketDataProvider;
class ITimeProvider;
class Ledger;
class MarketDataCache;
class OrderExecutionEngine;
class StrategyRepository;
class TokenBucket;

// Result of evaluating one rule set against one price series.
struct SignalDecision {
  domain::SignalType type{domain::SignalType::Hold};
  double strength{0.0};
  double confidence{0.0};
  std::string reason;
};

struct SignalPassReport {
  std::size_t strategies{0};
  std::size_t evaluations{0};
  std::size_t buys{0};
  std::size_t sells{0};
  std::size_t holds{0};
  std::size_t orders_submitted{0};
  std::size_t skipped_no_quote{0};
  std::size_t failed{0};
};

// -----------------------------------------------------------------------------
// StrategySignalEngine — rule evaluation and signal-driven orders
// -----------------------------------------------------------------------------
//
// @brief  Evaluates every active strategy that has at least one linked
//         account against each instrument in its universe, records the
//         resulting TradingSignal and, for accounts that opted in, turns
//         strong signals into market orders.
//
// @details
// Evaluation is per strategy and instrument, not per account: three accounts
// following the same strategy share one signal. Prices come from the
// MarketDataCache history. When the history is shorter than the strategy
// needs, it is seeded once from the provider's history endpoint, paying one
// token from the shared TokenBucket; if no token is available the strategy
// evaluates with what it has (usually Hold) and catches up next tick.
//
// Order synthesis, for each linked account with auto_trade enabled, when the
// signal is Buy or Sell and confidence >= confidence_threshold:
//   Buy  → skipped if the account already holds the instrument, has a
//          working order on it, or holds max_positions instruments;
//          otherwise a market buy sized by the strategy's sizing rule
//          (whole shares, never more than the available cash).
//   Sell → skipped unless the account holds the instrument and has no
//          working order on it; otherwise a market sell of the whole
//          position.
// Synthesized orders are submitted through the OrderExecutionEngine as
// Pending and fill on the execution job's next tick. The engine never
// writes positions or cash itself.
//
// Thread model:
//   runs on the strategy_signals job thread.
// -----------------------------------------------------------------------------
class StrategySignalEngine final : public IJob {
 public:
  StrategySignalEngine(const StrategyRepository& strategies, Ledger& ledger,
                       MarketDataCache& cache, OrderExecutionEngine& execution,
                       AuditLog& audit, const ITimeProvider& clock,
                       IMarketDataProvider* history_provider,
                       TokenBucket* rate_limiter);

  StrategySignalEngine(const StrategySignalEngine&) = delete;
  StrategySignalEngine& operator=(const StrategySignalEngine&) = delete;

  SignalPassReport evaluateAll();

  // Rule dispatch on the strategy kind. closes are oldest first; the last
  // element is the current price.
  static SignalDecision evaluate(const domain::StrategyRules& rules,
                                 const std::vector<double>& closes);

  // Whole-share quantity for a buy at price, never costing more than cash.
  static double orderQuantity(const domain::PositionSizing& sizing, double equity,
                              double cash, double price);

  std::string name() const override { return "strategy_signals"; }
  JobOutcome tick(const JobContext& context) override;

 private:
  static SignalDecision evaluateRsiReversion(const domain::RsiReversionRules& rules,
                                             const std::vector<double>& closes);
  static SignalDecision evaluateMovingAverageCross(
      const domain::MovingAverageCrossRules& rules, const std::vector<double>& closes);
  static SignalDecision evaluateCompositeScore(const domain::CompositeScoreRules& rules,
                                               const std::vector<double>& closes);

  std::vector<double> closesFor(const domain::Symbol& symbol, std::size_t required,
                                std::set<domain::Symbol>& seeded_this_pass);

  // Returns true when an order was submitted.
  bool actOnSignal(const domain::Strategy& strategy, const domain::Account& account,
                   const domain::TradingSignal& signal);

  const StrategyRepository& strategies_;
  Ledger& ledger_;
  MarketDataCache& cache_;
  OrderExecutionEngine& execution_;
  AuditLog& audit_;
  const ITimeProvider& clock_;
  IMarketDataProvider* history_provider_;
  TokenBucket* rate_limiter_;
  IdGenerator signal_ids_;
};

}  // namespace papertrade
