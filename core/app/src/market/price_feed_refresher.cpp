#include "papertrade/market/price_feed_refresher.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/market/i_market_data_provider.hpp"
#include "papertrade/market/market_data_cache.hpp"
#include "papertrade/market/token_bucket.hpp"
#include "papertrade/market/watchlist.hpp"
#include "papertrade/storage/ledger.hpp"
#include "papertrade/storage/strategy_repository.hpp"

#include <cstdint>
#include <iostream>
#include <set>
#include <sstream>

namespace papertrade {

PriceFeedRefresher::PriceFeedRefresher(IMarketDataProvider& provider,
                                       MarketDataCache& cache,
                                       TokenBucket& rate_limiter,
                                       const Ledger& ledger,
                                       const Watchlist& watchlist,
                                       const StrategyRepository& strategies)
    : provider_(provider),
      cache_(cache),
      rate_limiter_(rate_limiter),
      ledger_(ledger),
      watchlist_(watchlist),
      strategies_(strategies) {}

std::vector<domain::Symbol> PriceFeedRefresher::targetSymbols() const {
  std::set<domain::Symbol> symbols;
  for (auto& symbol : ledger_.referencedSymbols()) {
    symbols.insert(std::move(symbol));
  }
  for (auto& symbol : watchlist_.symbols()) {
    symbols.insert(std::move(symbol));
  }
  for (auto& symbol : strategies_.universeSymbols()) {
    symbols.insert(std::move(symbol));
  }
  return {symbols.begin(), symbols.end()};
}

std::vector<domain::Symbol> PriceFeedRefresher::deferredSymbols() const {
  std::lock_guard lock(deferred_mutex_);
  return deferred_;
}

// -----------------------------------------------------------------------------
// refresh()
// -----------------------------------------------------------------------------
// Processing order: instruments deferred by the previous pass (if still
// wanted), then the rest in symbol order. The first time a token cannot be
// acquired, that instrument and everything after it become the new
// deferred list.
// -----------------------------------------------------------------------------
RefreshReport PriceFeedRefresher::refresh() {
  const auto targets = targetSymbols();
  const std::set<domain::Symbol> wanted(targets.begin(), targets.end());

  std::vector<domain::Symbol> ordered;
  std::set<domain::Symbol> seen;
  {
    std::lock_guard lock(deferred_mutex_);
    for (const auto& symbol : deferred_) {
      if (wanted.count(symbol) != 0 && seen.insert(symbol).second) {
        ordered.push_back(symbol);
      }
    }
  }
  for (const auto& symbol : targets) {
    if (seen.insert(symbol).second) {
      ordered.push_back(symbol);
    }
  }

  RefreshReport report;
  report.requested = ordered.size();
  std::vector<domain::Symbol> still_deferred;

  for (std::size_t i = 0; i < ordered.size(); ++i) {
    const auto& symbol = ordered[i];
    if (!rate_limiter_.tryAcquire()) {
      still_deferred.assign(ordered.begin() + static_cast<std::ptrdiff_t>(i), ordered.end());
      break;
    }

    try {
      domain::Quote quote = provider_.fetchQuote(symbol);
      const std::int64_t fetched_as_of = quote.as_of_ms;
      switch (cache_.put(symbol, std::move(quote))) {
        case PutResult::Stored:
          ++report.updated;
          break;
        case PutResult::DroppedStale: {
          ++report.dropped_stale;
          const auto cached = cache_.get(symbol);
          std::cerr << "[PriceFeedRefresher] WARNING: out-of-order quote for " << symbol
                    << " dropped (as_of " << fetched_as_of << " < cached "
                    << (cached ? cached->as_of_ms : 0) << ")\n";
          break;
        }
        case PutResult::Rejected:
          ++report.failed;
          report.errors.emplace_back(symbol, "unusable price from provider");
          std::cerr << "[PriceFeedRefresher] WARNING: unusable price for "
                    << symbol << ", quote ignored\n";
          break;
      }
    } catch (const ProviderError& e) {
      if (e.kind() == ProviderErrorKind::RateLimited) {
        still_deferred.assign(ordered.begin() + static_cast<std::ptrdiff_t>(i), ordered.end());
        std::cerr << "[PriceFeedRefresher] WARNING: provider rate limited at "
                  << symbol << ", deferring " << still_deferred.size()
                  << " instrument(s)\n";
        break;
      }
      ++report.failed;
      report.errors.emplace_back(symbol, e.what());
      std::cerr << "[PriceFeedRefresher] WARNING: " << symbol << " failed ("
                << providerErrorKindToString(e.kind()) << "): " << e.what() << "\n";
    } catch (const std::exception& e) {
      ++report.failed;
      report.errors.emplace_back(symbol, e.what());
      std::cerr << "[PriceFeedRefresher] ERROR: " << symbol << ": " << e.what()
                << "\n";
    }
  }

  report.deferred = still_deferred.size();
  {
    std::lock_guard lock(deferred_mutex_);
    deferred_ = std::move(still_deferred);
  }
  return report;
}

JobOutcome PriceFeedRefresher::tick(const JobContext& /*context*/) {
  const RefreshReport report = refresh();

  std::ostringstream summary;
  summary << "requested=" << report.requested << " updated=" << report.updated
          << " stale=" << report.dropped_stale << " failed=" << report.failed
          << " deferred=" << report.deferred;
  std::cout << "[PriceFeedRefresher] " << summary.str() << "\n";

  return JobOutcome::success(report.requested - report.deferred, report.failed,
                             summary.str());
}

}  // namespace papertrade
