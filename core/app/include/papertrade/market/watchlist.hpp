#pragma once

#include "papertrade/domain/instrument.hpp"

#include <mutex>
#include <set>
#include <vector>

namespace papertrade {

// Instruments kept fresh even when nothing holds or trades them. Seeded from
// configuration; add/remove are for operators.
class Watchlist {
 public:
  Watchlist() = default;
  explicit Watchlist(const std::vector<domain::Symbol>& symbols);

  Watchlist(const Watchlist&) = delete;
  Watchlist& operator=(const Watchlist&) = delete;

  // Returns false for an empty symbol or one already present.
  bool add(const domain::Symbol& symbol);
  bool remove(const domain::Symbol& symbol);
  std::vector<domain::Symbol> symbols() const;

 private:
  mutable std::mutex mutex_;
  std::set<domain::Symbol> symbols_;
};

}  // namespace papertrade
