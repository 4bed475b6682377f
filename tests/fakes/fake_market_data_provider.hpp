#pragma once

#include "papertrade/common/errors.hpp"
#include "papertrade/domain/quote.hpp"
#include "papertrade/market/i_market_data_provider.hpp"
#include "papertrade/time/i_time_provider.hpp"
#include "papertrade/time/time_utils.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace papertrade {
namespace testing {

// -----------------------------------------------------------------------------
// FakeMarketDataProvider — scripted provider for deterministic tests
// -----------------------------------------------------------------------------
// Quotes are stamped with the injected clock unless a full Quote was
// scripted. A symbol scripted to fail throws ProviderError of that kind on
// every call until cleared. Unknown symbols are NotFound. Every call is
// recorded so tests can assert on rate limiting and deferral order.
// -----------------------------------------------------------------------------
class FakeMarketDataProvider final : public IMarketDataProvider {
 public:
  explicit FakeMarketDataProvider(const ITimeProvider& clock) : clock_(clock) {}

  void setPrice(const domain::Symbol& symbol, double price) {
    std::lock_guard lock(mutex_);
    prices_[symbol] = price;
    scripted_quotes_.erase(symbol);
  }

  void setQuote(const domain::Symbol& symbol, domain::Quote quote) {
    std::lock_guard lock(mutex_);
    scripted_quotes_[symbol] = std::move(quote);
  }

  void failWith(const domain::Symbol& symbol, ProviderErrorKind kind) {
    std::lock_guard lock(mutex_);
    failures_[symbol] = kind;
  }

  void clearFailure(const domain::Symbol& symbol) {
    std::lock_guard lock(mutex_);
    failures_.erase(symbol);
  }

  // One daily bar per close, the last one at the current clock time.
  void setHistory(const domain::Symbol& symbol, const std::vector<double>& closes) {
    std::lock_guard lock(mutex_);
    histories_[symbol] = closes;
  }

  domain::Quote fetchQuote(const domain::Symbol& symbol) override {
    std::lock_guard lock(mutex_);
    quote_requests_.push_back(symbol);
    throwIfFailing(symbol);
    if (auto it = scripted_quotes_.find(symbol); it != scripted_quotes_.end()) {
      return it->second;
    }
    auto it = prices_.find(symbol);
    if (it == prices_.end()) {
      throw ProviderError(ProviderErrorKind::NotFound, "unknown symbol " + symbol);
    }
    domain::Quote quote;
    quote.symbol = symbol;
    quote.price = it->second;
    quote.as_of_ms = clock_.now_ms();
    quote.source = "fake";
    return quote;
  }

  std::vector<domain::Bar> fetchHistory(const domain::Symbol& symbol,
                                        const HistoryRange& /*range*/) override {
    std::lock_guard lock(mutex_);
    history_requests_.push_back(symbol);
    throwIfFailing(symbol);
    std::vector<domain::Bar> bars;
    auto it = histories_.find(symbol);
    if (it == histories_.end()) {
      return bars;
    }
    const auto& closes = it->second;
    const std::int64_t now = clock_.now_ms();
    for (std::size_t i = 0; i < closes.size(); ++i) {
      domain::Bar bar;
      bar.timestamp_ms =
          now - static_cast<std::int64_t>(closes.size() - 1 - i) * kMillisPerDay;
      bar.open = bar.high = bar.low = bar.close = closes[i];
      bars.push_back(bar);
    }
    return bars;
  }

  std::string name() const override { return "fake"; }

  std::vector<domain::Symbol> quoteRequests() const {
    std::lock_guard lock(mutex_);
    return quote_requests_;
  }

  std::vector<domain::Symbol> historyRequests() const {
    std::lock_guard lock(mutex_);
    return history_requests_;
  }

  void clearRequests() {
    std::lock_guard lock(mutex_);
    quote_requests_.clear();
    history_requests_.clear();
  }

 private:
  void throwIfFailing(const domain::Symbol& symbol) const {
    auto it = failures_.find(symbol);
    if (it != failures_.end()) {
      throw ProviderError(it->second, std::string("scripted ") +
                                          providerErrorKindToString(it->second) +
                                          " for " + symbol);
    }
  }

  const ITimeProvider& clock_;
  mutable std::mutex mutex_;
  std::map<domain::Symbol, double> prices_;
  std::map<domain::Symbol, domain::Quote> scripted_quotes_;
  std::map<domain::Symbol, ProviderErrorKind> failures_;
  std::map<domain::Symbol, std::vector<double>> histories_;
  std::vector<domain::Symbol> quote_requests_;
  std::vector<domain::Symbol> history_requests_;
};

}  // namespace testing
}  // namespace papertrade
