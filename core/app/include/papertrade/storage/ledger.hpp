#pragma once

#include "papertrade/common/errors.hpp"
#include "papertrade/concurrent/id_generator.hpp"
#include "papertrade/domain/account.hpp"
#include "papertrade/domain/instrument.hpp"
#include "papertrade/domain/order.hpp"
#include "papertrade/domain/position.hpp"
#include "papertrade/domain/trade.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace papertrade {

class ITimeProvider;

// -----------------------------------------------------------------------------
// AccountBook — everything owned by one account
// -----------------------------------------------------------------------------
// The unit of atomicity. A fill changes cash, one position, one order and
// appends one trade, all inside the same book while its mutex is held, so
// no reader can observe cash debited without the matching position.
// -----------------------------------------------------------------------------
struct AccountBook {
  mutable std::mutex mutex;
  domain::Account account;
  std::map<domain::Symbol, domain::Position> positions;
  std::map<domain::OrderId, domain::Order> orders;
  std::vector<domain::Trade> trades;
};

// Consistent copy of an account and its positions, taken under one lock.
struct AccountView {
  domain::Account account;
  std::vector<domain::Position> positions;
};

// Plain-data image of the whole ledger, used for snapshot persistence.
struct AccountState {
  domain::Account account;
  std::vector<domain::Position> positions;
  std::vector<domain::Order> orders;
  std::vector<domain::Trade> trades;
};

struct LedgerState {
  std::vector<domain::Instrument> instruments;
  std::vector<AccountState> accounts;
  std::uint64_t next_order_id{1};
  std::uint64_t next_trade_id{1};
};

// -----------------------------------------------------------------------------
// Ledger — system of record for accounts, positions, orders and trades
// -----------------------------------------------------------------------------
//
// @brief  In-memory store with per-account locking, shared by the order
//         execution engine, the valuation service, the strategy engine and
//         the query interface.
//
// @details
// Locking is two-level:
//   books_mutex_ (shared_mutex) guards the account map itself. It is taken
//     exclusively only to open an account or import a snapshot; every other
//     operation takes it shared.
//   AccountBook::mutex serializes read-modify-write on one account. Jobs
//     working on different accounts never contend.
// The lock order is always books_mutex_ → AccountBook::mutex →
// index_mutex_ / instruments_mutex_, and no code calls back into the Ledger
// while holding a book lock.
//
// withAccount(id, fn) runs fn with the book locked. This is the only way to
// mutate an account; the OrderExecutionEngine uses it to commit fills and
// the valuation service writes only PositionValuation through
// recordValuation().
//
// Every accessor returns copies. Nothing hands out references into a book
// past the lock.
//
// setAvailable(false) makes every call throw StorageUnavailableError, which
// is how an outage of a real backing store presents itself to the jobs.
// -----------------------------------------------------------------------------
class Ledger {
 public:
  explicit Ledger(const ITimeProvider& clock);

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;
  Ledger(Ledger&&) = delete;
  Ledger& operator=(Ledger&&) = delete;

  // --- availability --------------------------------------------------------
  void setAvailable(bool available);
  bool available() const;

  // --- instruments ---------------------------------------------------------
  // Registers the instrument if unknown; returns the stored record.
  domain::Instrument registerInstrument(const domain::Symbol& symbol);
  std::optional<domain::Instrument> instrument(const domain::Symbol& symbol) const;
  std::vector<domain::Instrument> instruments() const;

  // --- accounts ------------------------------------------------------------
  // Throws ValidationError for an empty or duplicate id or a negative or
  // non-finite starting balance.
  domain::Account openAccount(domain::Account account);
  std::optional<domain::Account> account(const domain::AccountId& id) const;
  std::vector<domain::Account> accounts() const;
  std::optional<AccountView> accountView(const domain::AccountId& id) const;
  void setAutoTrade(const domain::AccountId& id, bool enabled);

  // --- orders --------------------------------------------------------------
  // Assigns the next order id and stores the order under its account.
  domain::Order addOrder(domain::Order order);
  std::optional<domain::Order> order(domain::OrderId id) const;
  std::optional<domain::AccountId> orderAccount(domain::OrderId id) const;
  // Non-terminal orders across all accounts, ascending id.
  std::vector<domain::Order> openOrders() const;
  std::vector<domain::Order> openOrders(const domain::AccountId& id) const;
  // Most recent first, at most limit entries.
  std::vector<domain::Order> orders(const domain::AccountId& id,
                                    std::size_t limit) const;

  // --- trades --------------------------------------------------------------
  // Most recent first, at most limit entries.
  std::vector<domain::Trade> trades(const domain::AccountId& id,
                                    std::size_t limit) const;
  std::size_t tradeCount(const domain::AccountId& id) const;

  // --- positions -----------------------------------------------------------
  std::vector<domain::Position> positions(const domain::AccountId& id) const;
  std::optional<domain::Position> position(const domain::AccountId& id,
                                           const domain::Symbol& symbol) const;
  // Writes valued.valuation onto the stored position, and nothing else.
  // Returns false when the position was closed, or a fill changed its
  // quantity or entry price, since valued was read.
  bool recordValuation(const domain::Position& valued);

  // Instruments with an open position or a non-terminal order, sorted.
  std::vector<domain::Symbol> referencedSymbols() const;

  // --- exclusive read-modify-write -----------------------------------------
  template <typename Fn>
  auto withAccount(const domain::AccountId& id, Fn&& fn)
      -> decltype(fn(std::declval<AccountBook&>()));

  template <typename Fn>
  auto withAccount(const domain::AccountId& id, Fn&& fn) const
      -> decltype(fn(std::declval<const AccountBook&>()));

  IdGenerator& tradeIds() { return trade_ids_; }

  // --- persistence ---------------------------------------------------------
  LedgerState exportState() const;
  // Replaces the whole ledger content.
  void importState(const LedgerState& state);

 private:
  void ensureAvailable() const;
  AccountBook* findBookLocked(const domain::AccountId& id) const;
  AccountBook& requireBookLocked(const domain::AccountId& id) const;

  const ITimeProvider& clock_;
  std::atomic<bool> available_{true};

  mutable std::shared_mutex books_mutex_;
  std::unordered_map<domain::AccountId, std::unique_ptr<AccountBook>> books_;

  mutable std::mutex index_mutex_;
  std::unordered_map<domain::OrderId, domain::AccountId> order_index_;

  mutable std::mutex instruments_mutex_;
  std::map<domain::Symbol, domain::Instrument> instruments_;

  IdGenerator order_ids_;
  IdGenerator trade_ids_;
};

template <typename Fn>
auto Ledger::withAccount(const domain::AccountId& id, Fn&& fn)
    -> decltype(fn(std::declval<AccountBook&>())) {
  ensureAvailable();
  std::shared_lock books_lock(books_mutex_);
  AccountBook& book = requireBookLocked(id);
  std::lock_guard book_lock(book.mutex);
  return fn(book);
}

template <typename Fn>
auto Ledger::withAccount(const domain::AccountId& id, Fn&& fn) const
    -> decltype(fn(std::declval<const AccountBook&>())) {
  ensureAvailable();
  std::shared_lock books_lock(books_mutex_);
  const AccountBook& book = requireBookLocked(id);
  std::lock_guard book_lock(book.mutex);
  return fn(book);
}

}  // namespace papertrade
