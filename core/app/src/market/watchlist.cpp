#include "papertrade/market/watchlist.hpp"

namespace papertrade {

Watchlist::Watchlist(const std::vector<domain::Symbol>& symbols) {
  for (const auto& symbol : symbols) {
    add(symbol);
  }
}

bool Watchlist::add(const domain::Symbol& symbol) {
  auto normalized = domain::normalizeSymbol(symbol);
  if (normalized.empty()) {
    return false;
  }
  std::lock_guard lock(mutex_);
  return symbols_.insert(std::move(normalized)).second;
}

bool Watchlist::remove(const domain::Symbol& symbol) {
  std::lock_guard lock(mutex_);
  return symbols_.erase(domain::normalizeSymbol(symbol)) > 0;
}

std::vector<domain::Symbol> Watchlist::symbols() const {
  std::lock_guard lock(mutex_);
  return {symbols_.begin(), symbols_.end()};
}

}  // namespace papertrade
