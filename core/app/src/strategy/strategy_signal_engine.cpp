#include "papertrade/strategy/strategy_signal_engine.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/execution/order_execution_engine.hpp"
#include "papertrade/market/i_market_data_provider.hpp"
#include "papertrade/market/market_data_cache.hpp"
#include "papertrade/market/token_bucket.hpp"
#include "papertrade/storage/audit_log.hpp"
#include "papertrade/storage/ledger.hpp"
#include "papertrade/storage/strategy_repository.hpp"
#include "papertrade/strategy/indicators.hpp"
#include "papertrade/time/i_time_provider.hpp"
#include "papertrade/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace papertrade {

namespace {

constexpr double kMaxConfidence = 0.9;

// Extra bars requested beyond the minimum to cover non-trading days.
constexpr std::size_t kHistoryPaddingDays = 10;

std::string formatValue(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

std::string join(const std::vector<std::string>& parts) {
  std::string result;
  for (const auto& part : parts) {
    if (!result.empty()) {
      result += ", ";
    }
    result += part;
  }
  return result;
}

SignalDecision insufficientHistory(std::size_t have, std::size_t need) {
  SignalDecision decision;
  decision.reason = "insufficient history (" + std::to_string(have) + " of " +
                    std::to_string(need) + " prices)";
  return decision;
}

}  // namespace

StrategySignalEngine::StrategySignalEngine(const StrategyRepository& strategies,
                                           Ledger& ledger, MarketDataCache& cache,
                                           OrderExecutionEngine& execution,
                                           AuditLog& audit, const ITimeProvider& clock,
                                           IMarketDataProvider* history_provider,
                                           TokenBucket* rate_limiter)
    : strategies_(strategies),
      ledger_(ledger),
      cache_(cache),
      execution_(execution),
      audit_(audit),
      clock_(clock),
      history_provider_(history_provider),
      rate_limiter_(rate_limiter) {}

// -----------------------------------------------------------------------------
// Rule evaluation
// -----------------------------------------------------------------------------
SignalDecision StrategySignalEngine::evaluate(const domain::StrategyRules& rules,
                                              const std::vector<double>& closes) {
  if (const auto* rsi = std::get_if<domain::RsiReversionRules>(&rules)) {
    return evaluateRsiReversion(*rsi, closes);
  }
  if (const auto* cross = std::get_if<domain::MovingAverageCrossRules>(&rules)) {
    return evaluateMovingAverageCross(*cross, closes);
  }
  return evaluateCompositeScore(std::get<domain::CompositeScoreRules>(rules), closes);
}

SignalDecision StrategySignalEngine::evaluateRsiReversion(
    const domain::RsiReversionRules& rules, const std::vector<double>& closes) {
  const auto period = static_cast<std::size_t>(rules.period);
  const auto rsi = indicators::relativeStrengthIndex(closes, period);
  if (!rsi) {
    return insufficientHistory(closes.size(), period + 1);
  }

  SignalDecision decision;
  if (*rsi < rules.oversold) {
    decision.type = domain::SignalType::Buy;
    decision.strength = (rules.oversold - *rsi) / rules.oversold;
    decision.confidence = std::min(kMaxConfidence, 0.5 + decision.strength);
    decision.reason = "RSI " + formatValue(*rsi) + " below oversold " +
                      formatValue(rules.oversold);
  } else if (*rsi > rules.overbought) {
    decision.type = domain::SignalType::Sell;
    decision.strength = (*rsi - rules.overbought) / (100.0 - rules.overbought);
    decision.confidence = std::min(kMaxConfidence, 0.5 + decision.strength);
    decision.reason = "RSI " + formatValue(*rsi) + " above overbought " +
                      formatValue(rules.overbought);
  } else {
    decision.reason = "RSI " + formatValue(*rsi) + " within [" +
                      formatValue(rules.oversold) + ", " +
                      formatValue(rules.overbought) + "]";
  }
  return decision;
}

// -----------------------------------------------------------------------------
// evaluateMovingAverageCross()
// -----------------------------------------------------------------------------
// A cross is detected between the previous close and the current one: the
// short SMA must have been on the other side of the long SMA one price ago.
// -----------------------------------------------------------------------------
SignalDecision StrategySignalEngine::evaluateMovingAverageCross(
    const domain::MovingAverageCrossRules& rules, const std::vector<double>& closes) {
  const auto short_window = static_cast<std::size_t>(rules.short_window);
  const auto long_window = static_cast<std::size_t>(rules.long_window);
  if (closes.size() < long_window + 1) {
    return insufficientHistory(closes.size(), long_window + 1);
  }

  const std::vector<double> previous(closes.begin(), closes.end() - 1);
  const double short_now = *indicators::simpleMovingAverage(closes, short_window);
  const double long_now = *indicators::simpleMovingAverage(closes, long_window);
  const double short_prev = *indicators::simpleMovingAverage(previous, short_window);
  const double long_prev = *indicators::simpleMovingAverage(previous, long_window);

  SignalDecision decision;
  const double spread = long_now != 0.0 ? std::abs(short_now - long_now) / long_now : 0.0;
  if (short_prev <= long_prev && short_now > long_now) {
    decision.type = domain::SignalType::Buy;
    decision.strength = spread;
    decision.confidence = std::min(kMaxConfidence, 0.6 + spread * 10.0);
    decision.reason = "golden cross: SMA" + std::to_string(short_window) + " " +
                      formatValue(short_now) + " crossed above SMA" +
                      std::to_string(long_window) + " " + formatValue(long_now);
  } else if (short_prev >= long_prev && short_now < long_now) {
    decision.type = domain::SignalType::Sell;
    decision.strength = spread;
    decision.confidence = std::min(kMaxConfidence, 0.6 + spread * 10.0);
    decision.reason = "death cross: SMA" + std::to_string(short_window) + " " +
                      formatValue(short_now) + " crossed below SMA" +
                      std::to_string(long_window) + " " + formatValue(long_now);
  } else {
    decision.reason = std::string("no crossover, short SMA ") +
                      (short_now >= long_now ? "above" : "below") + " long SMA";
  }
  return decision;
}

// -----------------------------------------------------------------------------
// evaluateCompositeScore()
// -----------------------------------------------------------------------------
// Additive score:
//   RSI below oversold +2 / above overbought -2
//   bullish trend +1 / bearish trend -1
//   close at or below the lower Bollinger band +1 / at or above the upper -1
//   near support +1 / near resistance -1
// score >= buy_score → Buy, score <= sell_score → Sell, confidence
// min(0.9, |score| / 10 + 0.5).
// -----------------------------------------------------------------------------
SignalDecision StrategySignalEngine::evaluateCompositeScore(
    const domain::CompositeScoreRules& rules, const std::vector<double>& closes) {
  const std::size_t needed = domain::requiredHistory(rules);
  if (closes.size() < needed) {
    return insufficientHistory(closes.size(), needed);
  }

  const double price = closes.back();
  int score = 0;
  std::vector<std::string> reasons;

  if (const auto rsi = indicators::relativeStrengthIndex(
          closes, static_cast<std::size_t>(rules.rsi_period))) {
    if (*rsi < rules.oversold) {
      score += 2;
      reasons.push_back("RSI oversold (" + formatValue(*rsi) + ")");
    } else if (*rsi > rules.overbought) {
      score -= 2;
      reasons.push_back("RSI overbought (" + formatValue(*rsi) + ")");
    }
  }

  if (const auto trend = indicators::priceTrend(
          closes, static_cast<std::size_t>(rules.short_window),
          static_cast<std::size_t>(rules.long_window))) {
    if (*trend == indicators::Trend::Bullish) {
      score += 1;
      reasons.emplace_back("bullish price trend");
    } else if (*trend == indicators::Trend::Bearish) {
      score -= 1;
      reasons.emplace_back("bearish price trend");
    }
  }

  if (const auto bands = indicators::bollingerBands(
          closes, static_cast<std::size_t>(rules.bollinger_window))) {
    if (price <= bands->lower) {
      score += 1;
      reasons.emplace_back("price at lower Bollinger band");
    } else if (price >= bands->upper) {
      score -= 1;
      reasons.emplace_back("price at upper Bollinger band");
    }
  }

  if (const auto levels = indicators::supportResistance(closes)) {
    if (indicators::isNear(price, levels->support, rules.proximity_percent)) {
      score += 1;
      reasons.emplace_back("price near support " + formatValue(levels->support));
    }
    if (indicators::isNear(price, levels->resistance, rules.proximity_percent)) {
      score -= 1;
      reasons.emplace_back("price near resistance " + formatValue(levels->resistance));
    }
  }

  SignalDecision decision;
  decision.strength = std::abs(static_cast<double>(score));
  const std::string detail = "score " + std::to_string(score);
  if (score >= rules.buy_score) {
    decision.type = domain::SignalType::Buy;
    decision.confidence = std::min(kMaxConfidence, decision.strength / 10.0 + 0.5);
    decision.reason = detail + ": " + join(reasons);
  } else if (score <= rules.sell_score) {
    decision.type = domain::SignalType::Sell;
    decision.confidence = std::min(kMaxConfidence, decision.strength / 10.0 + 0.5);
    decision.reason = detail + ": " + join(reasons);
  } else {
    decision.reason = reasons.empty() ? detail + ", no clear signal"
                                      : detail + ", mixed signals: " + join(reasons);
  }
  return decision;
}

double StrategySignalEngine::orderQuantity(const domain::PositionSizing& sizing,
                                           double equity, double cash, double price) {
  if (!domain::isUsablePrice(price) || cash <= 0.0) {
    return 0.0;
  }
  double budget = 0.0;
  if (const auto* fixed = std::get_if<domain::FixedNotionalSizing>(&sizing)) {
    budget = fixed->notional;
  } else {
    budget = equity * std::get<domain::PercentOfEquitySizing>(sizing).percent / 100.0;
  }
  budget = std::min(budget, cash);
  return std::floor(budget / price);
}

// -----------------------------------------------------------------------------
// closesFor()
// -----------------------------------------------------------------------------
// Seeds the cache from provider history at most once per instrument per
// pass, and only when a token is available.
// -----------------------------------------------------------------------------
std::vector<double> StrategySignalEngine::closesFor(
    const domain::Symbol& symbol, std::size_t required,
    std::set<domain::Symbol>& seeded_this_pass) {
  std::vector<double> closes = cache_.history(symbol, required);
  if (closes.size() >= required || history_provider_ == nullptr ||
      seeded_this_pass.count(symbol) != 0) {
    return closes;
  }
  seeded_this_pass.insert(symbol);

  if (rate_limiter_ != nullptr && !rate_limiter_->tryAcquire()) {
    std::cerr << "[StrategySignalEngine] WARNING: no rate budget to seed history for "
              << symbol << "\n";
    return closes;
  }

  const std::int64_t now = clock_.now_ms();
  HistoryRange range;
  range.to_ms = now - kMillisPerDay;
  range.from_ms =
      now - static_cast<std::int64_t>(required * 2 + kHistoryPaddingDays) * kMillisPerDay;
  range.interval = "1d";

  try {
    const auto bars = history_provider_->fetchHistory(symbol, range);
    std::vector<std::pair<std::int64_t, double>> points;
    points.reserve(bars.size());
    for (const auto& bar : bars) {
      points.emplace_back(bar.timestamp_ms, bar.close);
    }
    const std::size_t added = cache_.seedHistory(symbol, std::move(points));
    std::cout << "[StrategySignalEngine] seeded " << added << " historical price(s) for "
              << symbol << "\n";
  } catch (const ProviderError& e) {
    std::cerr << "[StrategySignalEngine] WARNING: history for " << symbol
              << " unavailable (" << providerErrorKindToString(e.kind())
              << "): " << e.what() << "\n";
  }
  return cache_.history(symbol, required);
}

// -----------------------------------------------------------------------------
// actOnSignal()
// -----------------------------------------------------------------------------
bool StrategySignalEngine::actOnSignal(const domain::Strategy& strategy,
                                       const domain::Account& account,
                                       const domain::TradingSignal& signal) {
  if (signal.type == domain::SignalType::Hold ||
      signal.confidence < strategy.confidence_threshold) {
    return false;
  }

  const auto view = ledger_.accountView(account.id);
  if (!view || !view->account.auto_trade || !view->account.active) {
    return false;
  }

  const auto working = ledger_.openOrders(account.id);
  const bool has_working_order =
      std::any_of(working.begin(), working.end(),
                  [&](const domain::Order& o) { return o.symbol == signal.symbol; });
  if (has_working_order) {
    std::cout << "[StrategySignalEngine] " << account.id << ": working order on "
              << signal.symbol << ", signal not acted on\n";
    return false;
  }

  const auto held = std::find_if(
      view->positions.begin(), view->positions.end(),
      [&](const domain::Position& p) { return p.symbol == signal.symbol; });

  domain::OrderRequest request;
  request.account_id = account.id;
  request.symbol = signal.symbol;
  request.terms = domain::MarketTerms{};
  request.strategy_id = strategy.id;

  if (signal.type == domain::SignalType::Buy) {
    if (held != view->positions.end()) {
      return false;
    }
    if (view->positions.size() >= strategy.max_positions) {
      std::cout << "[StrategySignalEngine] " << account.id << ": max positions ("
                << strategy.max_positions << ") reached, skipping buy of "
                << signal.symbol << "\n";
      return false;
    }

    double equity = view->account.cash_balance;
    for (const auto& position : view->positions) {
      const auto quote = cache_.get(position.symbol);
      equity += position.quantity *
                (quote ? quote->price : position.average_entry_price);
    }
    const double quantity =
        orderQuantity(strategy.sizing, equity, view->account.cash_balance, signal.price);
    if (quantity < 1.0) {
      std::cout << "[StrategySignalEngine] " << account.id
                << ": sized quantity below one share for " << signal.symbol << "\n";
      return false;
    }
    request.side = domain::Side::Buy;
    request.quantity = quantity;
  } else {
    if (held == view->positions.end()) {
      return false;
    }
    request.side = domain::Side::Sell;
    request.quantity = held->quantity;
  }

  try {
    execution_.submitOrder(request);
    return true;
  } catch (const ValidationError& e) {
    std::cerr << "[StrategySignalEngine] WARNING: order for " << account.id << " "
              << signal.symbol << " rejected at submission: " << e.what() << "\n";
    return false;
  }
}

// -----------------------------------------------------------------------------
// evaluateAll()
// -----------------------------------------------------------------------------
SignalPassReport StrategySignalEngine::evaluateAll() {
  SignalPassReport report;
  const auto accounts = ledger_.accounts();
  std::set<domain::Symbol> seeded_this_pass;

  for (const auto& strategy : strategies_.active()) {
    std::vector<domain::Account> linked;
    for (const auto& account : accounts) {
      if (account.active && account.strategy_id == strategy.id) {
        linked.push_back(account);
      }
    }
    if (linked.empty()) {
      continue;
    }
    ++report.strategies;

    const std::size_t required = domain::requiredHistory(strategy.rules);
    for (const auto& symbol : strategy.universe) {
      try {
        const auto quote = cache_.get(symbol);
        if (!quote) {
          ++report.skipped_no_quote;
          continue;
        }

        const auto closes = closesFor(symbol, required, seeded_this_pass);
        const SignalDecision decision = evaluate(strategy.rules, closes);

        domain::TradingSignal signal;
        signal.id = signal_ids_.next_id();
        signal.strategy_id = strategy.id;
        signal.symbol = symbol;
        signal.type = decision.type;
        signal.strength = decision.strength;
        signal.confidence = decision.confidence;
        signal.price = quote->price;
        signal.reason = decision.reason;
        signal.timestamp_ms = clock_.now_ms();
        audit_.recordSignal(signal);
        ++report.evaluations;

        switch (signal.type) {
          case domain::SignalType::Buy:  ++report.buys;  break;
          case domain::SignalType::Sell: ++report.sells; break;
          case domain::SignalType::Hold: ++report.holds; break;
        }
        if (signal.type != domain::SignalType::Hold) {
          std::cout << "[StrategySignalEngine] " << strategy.name << " "
                    << domain::signalTypeToString(signal.type) << " " << symbol
                    << " confidence=" << formatValue(signal.confidence) << " ("
                    << signal.reason << ")\n";
        }

        for (const auto& account : linked) {
          if (actOnSignal(strategy, account, signal)) {
            ++report.orders_submitted;
          }
        }
      } catch (const StorageUnavailableError&) {
        throw;
      } catch (const std::exception& e) {
        ++report.failed;
        std::cerr << "[StrategySignalEngine] ERROR: strategy " << strategy.id << " "
                  << symbol << ": " << e.what() << "\n";
      }
    }
  }
  return report;
}

JobOutcome StrategySignalEngine::tick(const JobContext& /*context*/) {
  const SignalPassReport report = evaluateAll();

  std::ostringstream summary;
  summary << "strategies=" << report.strategies
          << " evaluations=" << report.evaluations << " buy=" << report.buys
          << " sell=" << report.sells << " hold=" << report.holds
          << " orders=" << report.orders_submitted
          << " no_quote=" << report.skipped_no_quote << " failed=" << report.failed;
  std::cout << "[StrategySignalEngine] " << summary.str() << "\n";
  return JobOutcome::success(report.evaluations, report.failed, summary.str());
}

}  // namespace papertrade
