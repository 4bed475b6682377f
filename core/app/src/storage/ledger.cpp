#include "papertrade/storage/ledger.hpp"

#include "papertrade/time/i_time_provider.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace papertrade {

namespace {

template <typename T>
std::vector<T> mostRecent(const std::vector<T>& items, std::size_t limit) {
  const std::size_t count = std::min(limit, items.size());
  return std::vector<T>(items.rbegin(), items.rbegin() + static_cast<std::ptrdiff_t>(count));
}

}  // namespace

Ledger::Ledger(const ITimeProvider& clock) : clock_(clock) {}

void Ledger::setAvailable(bool available) {
  available_.store(available);
  if (!available) {
    std::cerr << "[Ledger] WARNING: storage marked unavailable\n";
  } else {
    std::cout << "[Ledger] storage available\n";
  }
}

bool Ledger::available() const { return available_.load(); }

void Ledger::ensureAvailable() const {
  if (!available_.load()) {
    throw StorageUnavailableError("ledger storage is unavailable");
  }
}

AccountBook* Ledger::findBookLocked(const domain::AccountId& id) const {
  auto it = books_.find(id);
  return it == books_.end() ? nullptr : it->second.get();
}

AccountBook& Ledger::requireBookLocked(const domain::AccountId& id) const {
  AccountBook* book = findBookLocked(id);
  if (book == nullptr) {
    throw ValidationError("unknown account: " + id);
  }
  return *book;
}

// -----------------------------------------------------------------------------
// Instruments
// -----------------------------------------------------------------------------
domain::Instrument Ledger::registerInstrument(const domain::Symbol& symbol) {
  ensureAvailable();
  std::lock_guard lock(instruments_mutex_);
  auto [it, inserted] = instruments_.try_emplace(symbol);
  if (inserted) {
    it->second.symbol = symbol;
  }
  return it->second;
}

std::optional<domain::Instrument> Ledger::instrument(
    const domain::Symbol& symbol) const {
  ensureAvailable();
  std::lock_guard lock(instruments_mutex_);
  auto it = instruments_.find(symbol);
  if (it == instruments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Instrument> Ledger::instruments() const {
  ensureAvailable();
  std::lock_guard lock(instruments_mutex_);
  std::vector<domain::Instrument> result;
  result.reserve(instruments_.size());
  for (const auto& [symbol, instrument] : instruments_) {
    result.push_back(instrument);
  }
  return result;
}

// -----------------------------------------------------------------------------
// Accounts
// -----------------------------------------------------------------------------
domain::Account Ledger::openAccount(domain::Account account) {
  ensureAvailable();
  if (account.id.empty()) {
    throw ValidationError("account id must not be empty");
  }
  if (!std::isfinite(account.cash_balance) || account.cash_balance < 0.0) {
    throw ValidationError("account " + account.id +
                          ": starting cash must be a non-negative number");
  }
  if (account.initial_cash <= 0.0) {
    account.initial_cash = account.cash_balance;
  }
  if (account.created_at_ms == 0) {
    account.created_at_ms = clock_.now_ms();
  }

  auto book = std::make_unique<AccountBook>();
  book->account = account;

  std::unique_lock lock(books_mutex_);
  if (books_.count(account.id) != 0) {
    throw ValidationError("account already exists: " + account.id);
  }
  books_.emplace(account.id, std::move(book));
  return account;
}

std::optional<domain::Account> Ledger::account(const domain::AccountId& id) const {
  ensureAvailable();
  std::shared_lock books_lock(books_mutex_);
  const AccountBook* book = findBookLocked(id);
  if (book == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(book->mutex);
  return book->account;
}

std::vector<domain::Account> Ledger::accounts() const {
  ensureAvailable();
  std::vector<domain::Account> result;
  {
    std::shared_lock books_lock(books_mutex_);
    result.reserve(books_.size());
    for (const auto& [id, book] : books_) {
      std::lock_guard lock(book->mutex);
      result.push_back(book->account);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Account& a, const domain::Account& b) { return a.id < b.id; });
  return result;
}

std::optional<AccountView> Ledger::accountView(const domain::AccountId& id) const {
  ensureAvailable();
  std::shared_lock books_lock(books_mutex_);
  const AccountBook* book = findBookLocked(id);
  if (book == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(book->mutex);
  AccountView view;
  view.account = book->account;
  view.positions.reserve(book->positions.size());
  for (const auto& [symbol, position] : book->positions) {
    view.positions.push_back(position);
  }
  return view;
}

void Ledger::setAutoTrade(const domain::AccountId& id, bool enabled) {
  withAccount(id, [enabled](AccountBook& book) { book.account.auto_trade = enabled; });
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
domain::Order Ledger::addOrder(domain::Order order) {
  return withAccount(order.account_id, [&](AccountBook& book) {
    order.id = order_ids_.next_id();
    book.orders.emplace(order.id, order);
    {
      std::lock_guard index_lock(index_mutex_);
      order_index_[order.id] = order.account_id;
    }
    return order;
  });
}

std::optional<domain::AccountId> Ledger::orderAccount(domain::OrderId id) const {
  ensureAvailable();
  std::lock_guard lock(index_mutex_);
  auto it = order_index_.find(id);
  if (it == order_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Order> Ledger::order(domain::OrderId id) const {
  auto owner = orderAccount(id);
  if (!owner) {
    return std::nullopt;
  }
  return withAccount(*owner, [id](const AccountBook& book) -> std::optional<domain::Order> {
    auto it = book.orders.find(id);
    if (it == book.orders.end()) {
      return std::nullopt;
    }
    return it->second;
  });
}

std::vector<domain::Order> Ledger::openOrders() const {
  ensureAvailable();
  std::vector<domain::Order> result;
  {
    std::shared_lock books_lock(books_mutex_);
    for (const auto& [id, book] : books_) {
      std::lock_guard lock(book->mutex);
      for (const auto& [order_id, order] : book->orders) {
        if (!domain::isTerminal(order.status)) {
          result.push_back(order);
        }
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) { return a.id < b.id; });
  return result;
}

std::vector<domain::Order> Ledger::openOrders(const domain::AccountId& id) const {
  return withAccount(id, [](const AccountBook& book) {
    std::vector<domain::Order> result;
    for (const auto& [order_id, order] : book.orders) {
      if (!domain::isTerminal(order.status)) {
        result.push_back(order);
      }
    }
    return result;
  });
}

std::vector<domain::Order> Ledger::orders(const domain::AccountId& id,
                                          std::size_t limit) const {
  return withAccount(id, [limit](const AccountBook& book) {
    std::vector<domain::Order> result;
    for (auto it = book.orders.rbegin(); it != book.orders.rend() && result.size() < limit; ++it) {
      result.push_back(it->second);
    }
    return result;
  });
}

// -----------------------------------------------------------------------------
// Trades and positions
// -----------------------------------------------------------------------------
std::vector<domain::Trade> Ledger::trades(const domain::AccountId& id,
                                          std::size_t limit) const {
  return withAccount(id, [limit](const AccountBook& book) {
    return mostRecent(book.trades, limit);
  });
}

std::size_t Ledger::tradeCount(const domain::AccountId& id) const {
  return withAccount(id, [](const AccountBook& book) { return book.trades.size(); });
}

std::vector<domain::Position> Ledger::positions(const domain::AccountId& id) const {
  return withAccount(id, [](const AccountBook& book) {
    std::vector<domain::Position> result;
    result.reserve(book.positions.size());
    for (const auto& [symbol, position] : book.positions) {
      result.push_back(position);
    }
    return result;
  });
}

std::optional<domain::Position> Ledger::position(const domain::AccountId& id,
                                                 const domain::Symbol& symbol) const {
  return withAccount(id, [&symbol](const AccountBook& book) -> std::optional<domain::Position> {
    auto it = book.positions.find(symbol);
    if (it == book.positions.end()) {
      return std::nullopt;
    }
    return it->second;
  });
}

bool Ledger::recordValuation(const domain::Position& valued) {
  if (!valued.valuation) {
    return false;
  }
  return withAccount(valued.account_id, [&](AccountBook& book) {
    auto it = book.positions.find(valued.symbol);
    if (it == book.positions.end() || it->second.quantity != valued.quantity ||
        it->second.average_entry_price != valued.average_entry_price) {
      return false;
    }
    it->second.valuation = valued.valuation;
    return true;
  });
}

std::vector<domain::Symbol> Ledger::referencedSymbols() const {
  ensureAvailable();
  std::set<domain::Symbol> symbols;
  {
    std::shared_lock books_lock(books_mutex_);
    for (const auto& [id, book] : books_) {
      std::lock_guard lock(book->mutex);
      for (const auto& [symbol, position] : book->positions) {
        symbols.insert(symbol);
      }
      for (const auto& [order_id, order] : book->orders) {
        if (!domain::isTerminal(order.status)) {
          symbols.insert(order.symbol);
        }
      }
    }
  }
  return {symbols.begin(), symbols.end()};
}

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------
LedgerState Ledger::exportState() const {
  ensureAvailable();
  LedgerState state;
  state.instruments = instruments();
  {
    std::shared_lock books_lock(books_mutex_);
    for (const auto& [id, book] : books_) {
      std::lock_guard lock(book->mutex);
      AccountState account_state;
      account_state.account = book->account;
      for (const auto& [symbol, position] : book->positions) {
        account_state.positions.push_back(position);
      }
      for (const auto& [order_id, order] : book->orders) {
        account_state.orders.push_back(order);
      }
      account_state.trades = book->trades;
      state.accounts.push_back(std::move(account_state));
    }
  }
  std::sort(state.accounts.begin(), state.accounts.end(),
            [](const AccountState& a, const AccountState& b) {
              return a.account.id < b.account.id;
            });
  state.next_order_id = order_ids_.peek();
  state.next_trade_id = trade_ids_.peek();
  return state;
}

// -----------------------------------------------------------------------------
// importState()
// -----------------------------------------------------------------------------
// Builds the new book map completely before swapping it in under the
// exclusive lock, so a malformed state leaves the current content intact.
// Id generators only move forward.
// -----------------------------------------------------------------------------
void Ledger::importState(const LedgerState& state) {
  ensureAvailable();
  std::unordered_map<domain::AccountId, std::unique_ptr<AccountBook>> books;
  std::unordered_map<domain::OrderId, domain::AccountId> index;
  std::uint64_t max_order_id = 0;
  std::uint64_t max_trade_id = 0;

  for (const auto& account_state : state.accounts) {
    const auto& id = account_state.account.id;
    if (id.empty() || books.count(id) != 0) {
      throw ValidationError("snapshot contains an empty or duplicate account id");
    }
    auto book = std::make_unique<AccountBook>();
    book->account = account_state.account;
    for (const auto& position : account_state.positions) {
      book->positions[position.symbol] = position;
    }
    for (const auto& order : account_state.orders) {
      book->orders[order.id] = order;
      index[order.id] = id;
      max_order_id = std::max(max_order_id, order.id);
    }
    book->trades = account_state.trades;
    for (const auto& trade : account_state.trades) {
      max_trade_id = std::max(max_trade_id, trade.id);
    }
    books.emplace(id, std::move(book));
  }

  std::map<domain::Symbol, domain::Instrument> instruments;
  for (const auto& instrument : state.instruments) {
    instruments[instrument.symbol] = instrument;
  }

  {
    std::unique_lock books_lock(books_mutex_);
    books_ = std::move(books);
    {
      std::lock_guard index_lock(index_mutex_);
      order_index_ = std::move(index);
    }
    std::lock_guard instruments_lock(instruments_mutex_);
    instruments_ = std::move(instruments);
  }

  auto lastUsed = [](std::uint64_t next_id) { return next_id > 0 ? next_id - 1 : 0; };
  order_ids_.advance_past(std::max(max_order_id, lastUsed(state.next_order_id)));
  trade_ids_.advance_past(std::max(max_trade_id, lastUsed(state.next_trade_id)));
}

}  // namespace papertrade
