#include "papertrade/storage/strategy_repository.hpp"

#include "papertrade/common/errors.hpp"

#include <cmath>
#include <mutex>
#include <set>
#include <string>

namespace papertrade {

namespace {

void require(bool condition, const domain::Strategy& strategy, const std::string& what) {
  if (!condition) {
    throw ConfigError("strategy " + std::to_string(strategy.id) + " (" +
                      strategy.name + "): " + what);
  }
}

}  // namespace

StrategyRepository::StrategyRepository(const std::vector<domain::Strategy>& strategies) {
  for (const auto& strategy : strategies) {
    upsert(strategy);
  }
}

void StrategyRepository::validate(const domain::Strategy& strategy) {
  require(strategy.confidence_threshold >= 0.0 && strategy.confidence_threshold <= 1.0,
          strategy, "confidence_threshold must be within [0, 1]");
  require(strategy.max_positions > 0, strategy, "max_positions must be positive");

  if (const auto* rsi = std::get_if<domain::RsiReversionRules>(&strategy.rules)) {
    require(rsi->period > 1, strategy, "rsi period must be greater than 1");
    require(rsi->oversold > 0.0 && rsi->oversold < rsi->overbought &&
                rsi->overbought < 100.0,
            strategy, "rsi thresholds must satisfy 0 < oversold < overbought < 100");
  } else if (const auto* cross =
                 std::get_if<domain::MovingAverageCrossRules>(&strategy.rules)) {
    require(cross->short_window > 0 && cross->short_window < cross->long_window,
            strategy, "short_window must be positive and below long_window");
  } else if (const auto* composite =
                 std::get_if<domain::CompositeScoreRules>(&strategy.rules)) {
    require(composite->rsi_period > 1, strategy, "rsi_period must be greater than 1");
    require(composite->short_window > 0 &&
                composite->short_window < composite->long_window,
            strategy, "short_window must be positive and below long_window");
    require(composite->bollinger_window > 1, strategy,
            "bollinger_window must be greater than 1");
    require(composite->buy_score > 0 && composite->sell_score < 0, strategy,
            "buy_score must be positive and sell_score negative");
  }

  if (const auto* fixed = std::get_if<domain::FixedNotionalSizing>(&strategy.sizing)) {
    require(std::isfinite(fixed->notional) && fixed->notional > 0.0, strategy,
            "fixed notional must be positive");
  } else if (const auto* pct =
                 std::get_if<domain::PercentOfEquitySizing>(&strategy.sizing)) {
    require(pct->percent > 0.0 && pct->percent <= 100.0, strategy,
            "percent_of_equity must be within (0, 100]");
  }
}

void StrategyRepository::upsert(domain::Strategy strategy) {
  for (auto& symbol : strategy.universe) {
    symbol = domain::normalizeSymbol(symbol);
  }
  validate(strategy);
  std::unique_lock lock(mutex_);
  strategies_[strategy.id] = std::move(strategy);
}

std::optional<domain::Strategy> StrategyRepository::find(domain::StrategyId id) const {
  std::shared_lock lock(mutex_);
  auto it = strategies_.find(id);
  if (it == strategies_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Strategy> StrategyRepository::all() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Strategy> result;
  for (const auto& [id, strategy] : strategies_) {
    result.push_back(strategy);
  }
  return result;
}

std::vector<domain::Strategy> StrategyRepository::active() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Strategy> result;
  for (const auto& [id, strategy] : strategies_) {
    if (strategy.active) {
      result.push_back(strategy);
    }
  }
  return result;
}

std::vector<domain::Symbol> StrategyRepository::universeSymbols() const {
  std::shared_lock lock(mutex_);
  std::set<domain::Symbol> symbols;
  for (const auto& [id, strategy] : strategies_) {
    if (strategy.active) {
      symbols.insert(strategy.universe.begin(), strategy.universe.end());
    }
  }
  return {symbols.begin(), symbols.end()};
}

}  // namespace papertrade
