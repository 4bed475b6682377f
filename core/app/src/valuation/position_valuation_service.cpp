#include "papertrade/valuation/position_valuation_service.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/market/market_data_cache.hpp"
#include "papertrade/storage/audit_log.hpp"
#include "papertrade/storage/ledger.hpp"
#include "papertrade/time/i_time_provider.hpp"

#include <iostream>
#include <sstream>

namespace papertrade {

PositionValuationService::PositionValuationService(Ledger& ledger,
                                                   const MarketDataCache& cache,
                                                   AuditLog& audit,
                                                   const ITimeProvider& clock,
                                                   std::int64_t max_quote_age_ms)
    : ledger_(ledger),
      cache_(cache),
      audit_(audit),
      clock_(clock),
      max_quote_age_ms_(max_quote_age_ms) {}

domain::PositionValuation PositionValuationService::valuePosition(
    const domain::Position& position, std::int64_t now_ms) const {
  domain::PositionValuation valuation;
  valuation.priced_at_ms = now_ms;

  const auto quote = cache_.get(position.symbol);
  if (quote && now_ms - quote->as_of_ms <= max_quote_age_ms_) {
    valuation.last_price = quote->price;
    valuation.stale = false;
  } else if (quote) {
    valuation.last_price = quote->price;
    valuation.stale = true;
  } else if (position.valuation && domain::isUsablePrice(position.valuation->last_price)) {
    valuation.last_price = position.valuation->last_price;
    valuation.stale = true;
  } else {
    valuation.last_price = position.average_entry_price;
    valuation.stale = true;
  }

  valuation.market_value = position.quantity * valuation.last_price;
  valuation.unrealized_pnl =
      (valuation.last_price - position.average_entry_price) * position.quantity;
  return valuation;
}

domain::AccountSnapshot PositionValuationService::valueAccount(
    const domain::Account& account,
    const std::vector<domain::Position>& positions,
    std::vector<domain::Position>* valued_positions) const {
  const std::int64_t now = clock_.now_ms();

  domain::AccountSnapshot snapshot;
  snapshot.account_id = account.id;
  snapshot.timestamp_ms = now;
  snapshot.cash_balance = account.cash_balance;
  snapshot.realized_pnl = account.realized_pnl;
  snapshot.position_count = positions.size();

  for (const auto& position : positions) {
    const domain::PositionValuation valuation = valuePosition(position, now);
    snapshot.portfolio_value += valuation.market_value;
    snapshot.unrealized_pnl += valuation.unrealized_pnl;
    if (valuation.stale) {
      ++snapshot.stale_positions;
    }
    if (valued_positions != nullptr) {
      domain::Position valued = position;
      valued.valuation = valuation;
      valued_positions->push_back(std::move(valued));
    }
  }
  snapshot.total_equity = snapshot.cash_balance + snapshot.portfolio_value;
  return snapshot;
}

// -----------------------------------------------------------------------------
// revalue()
// -----------------------------------------------------------------------------
// A position closed or filled between the view and recordValuation() is not
// written: the stored valuation stays with the quantity it was computed for
// and the next pass values the new one. The snapshot still reflects the
// consistent view it was taken from.
// -----------------------------------------------------------------------------
ValuationReport PositionValuationService::revalue() {
  ValuationReport report;
  const auto accounts = ledger_.accounts();

  for (const auto& account : accounts) {
    try {
      const auto view = ledger_.accountView(account.id);
      if (!view) {
        continue;
      }
      std::vector<domain::Position> valued;
      const domain::AccountSnapshot snapshot =
          valueAccount(view->account, view->positions, &valued);

      for (const auto& position : valued) {
        if (!ledger_.recordValuation(position)) {
          ++report.superseded_positions;
        }
      }
      audit_.recordSnapshot(snapshot);

      ++report.accounts;
      report.positions += snapshot.position_count;
      report.stale_positions += snapshot.stale_positions;
    } catch (const StorageUnavailableError&) {
      throw;
    } catch (const std::exception& e) {
      ++report.failed_accounts;
      std::cerr << "[PositionValuationService] ERROR: account " << account.id
                << ": " << e.what() << "\n";
    }
  }

  if (report.stale_positions > 0) {
    std::cerr << "[PositionValuationService] WARNING: " << report.stale_positions
              << " position(s) valued without a fresh quote\n";
  }
  return report;
}

domain::AccountPerformance PositionValuationService::performance(
    const domain::AccountId& id) const {
  const auto view = ledger_.accountView(id);
  if (!view) {
    throw ValidationError("unknown account: " + id);
  }

  domain::AccountPerformance result;
  result.summary = valueAccount(view->account, view->positions, &result.holdings);
  result.initial_cash = view->account.initial_cash;
  result.total_pnl = result.summary.total_equity - result.initial_cash;
  result.total_return_percent =
      result.initial_cash > 0.0 ? result.total_pnl / result.initial_cash * 100.0 : 0.0;
  result.trade_count = ledger_.tradeCount(id);
  return result;
}

JobOutcome PositionValuationService::tick(const JobContext& /*context*/) {
  const ValuationReport report = revalue();

  std::ostringstream summary;
  summary << "accounts=" << report.accounts << " positions=" << report.positions
          << " stale=" << report.stale_positions
          << " superseded=" << report.superseded_positions
          << " failed=" << report.failed_accounts;
  return JobOutcome::success(report.accounts, report.failed_accounts, summary.str());
}

}  // namespace papertrade
