#include "papertrade/execution/order_execution_engine.hpp"

#include "papertrade/common/errors.hpp"
#include "papertrade/domain/trade.hpp"
#include "papertrade/market/market_data_cache.hpp"
#include "papertrade/storage/audit_log.hpp"
#include "papertrade/storage/ledger.hpp"
#include "papertrade/time/i_time_provider.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

namespace papertrade {

namespace {

// Tolerance for comparing cash against a fill notional.
constexpr double kCashEpsilon = 1e-6;

bool isPositiveFinite(double value) { return std::isfinite(value) && value > 0.0; }

struct CommitOutcome {
  FillResult result{FillResult::AlreadyTerminal};
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  std::optional<domain::Trade> trade;
};

}  // namespace

const char* fillResultToString(FillResult result) {
  switch (result) {
    case FillResult::Filled:           return "filled";
    case FillResult::PartiallyFilled:  return "partially_filled";
    case FillResult::Rejected:         return "rejected";
    case FillResult::NotTriggered:     return "not_triggered";
    case FillResult::QuoteUnavailable: return "quote_unavailable";
    case FillResult::QuoteStale:       return "quote_stale";
    case FillResult::AlreadyTerminal:  return "already_terminal";
  }
  return "unknown";
}

OrderExecutionEngine::OrderExecutionEngine(Ledger& ledger,
                                           const MarketDataCache& cache,
                                           AuditLog& audit,
                                           const ITimeProvider& clock,
                                           std::unique_ptr<IFillPolicy> fill_policy,
                                           ExecutionSettings settings)
    : ledger_(ledger),
      cache_(cache),
      audit_(audit),
      clock_(clock),
      fill_policy_(fill_policy ? std::move(fill_policy)
                               : std::make_unique<FullFillPolicy>()),
      settings_(settings) {}

// -----------------------------------------------------------------------------
// Trigger evaluation, one function per order kind
// -----------------------------------------------------------------------------
bool OrderExecutionEngine::evaluateMarket(const domain::MarketTerms& /*terms*/,
                                          domain::Side /*side*/, double /*price*/) {
  return true;
}

bool OrderExecutionEngine::evaluateLimit(const domain::LimitTerms& terms,
                                         domain::Side side, double price) {
  return side == domain::Side::Buy ? price <= terms.limit_price
                                   : price >= terms.limit_price;
}

bool OrderExecutionEngine::evaluateStop(const domain::StopTerms& terms,
                                        domain::Side side, double price) {
  return side == domain::Side::Buy ? price >= terms.stop_price
                                   : price <= terms.stop_price;
}

bool OrderExecutionEngine::isTriggered(const domain::Order& order, double price) {
  if (const auto* limit = std::get_if<domain::LimitTerms>(&order.terms)) {
    return evaluateLimit(*limit, order.side, price);
  }
  if (const auto* stop = std::get_if<domain::StopTerms>(&order.terms)) {
    return evaluateStop(*stop, order.side, price);
  }
  return evaluateMarket(std::get<domain::MarketTerms>(order.terms), order.side, price);
}

// -----------------------------------------------------------------------------
// applyFillToPosition()
// -----------------------------------------------------------------------------
// Long-only version of the usual weighted-average bookkeeping: buys move the
// average entry price, sells realize profit against it and leave it alone.
// -----------------------------------------------------------------------------
double OrderExecutionEngine::applyFillToPosition(domain::Position& position,
                                                 domain::Side side,
                                                 double quantity, double price) {
  if (side == domain::Side::Buy) {
    const double new_quantity = position.quantity + quantity;
    position.average_entry_price =
        new_quantity > 0.0
            ? (position.quantity * position.average_entry_price + quantity * price) /
                  new_quantity
            : price;
    position.quantity = new_quantity;
    return 0.0;
  }

  const double closed = std::min(quantity, position.quantity);
  const double realized = closed * (price - position.average_entry_price);
  position.quantity -= closed;
  if (position.quantity <= domain::kQuantityEpsilon) {
    position.quantity = 0.0;
  }
  position.realized_pnl += realized;
  return realized;
}

// -----------------------------------------------------------------------------
// submitOrder()
// -----------------------------------------------------------------------------
domain::Order OrderExecutionEngine::submitOrder(domain::OrderRequest request) {
  request.symbol = domain::normalizeSymbol(request.symbol);
  if (request.symbol.empty()) {
    throw ValidationError("order symbol must not be empty");
  }
  if (!isPositiveFinite(request.quantity)) {
    throw ValidationError("order quantity must be a positive number");
  }
  if (const auto* limit = std::get_if<domain::LimitTerms>(&request.terms)) {
    if (!isPositiveFinite(limit->limit_price)) {
      throw ValidationError("limit order requires a positive limit_price");
    }
  }
  if (const auto* stop = std::get_if<domain::StopTerms>(&request.terms)) {
    if (!isPositiveFinite(stop->stop_price)) {
      throw ValidationError("stop order requires a positive stop_price");
    }
  }

  const auto account = ledger_.account(request.account_id);
  if (!account) {
    throw ValidationError("unknown account: " + request.account_id);
  }
  if (!account->active) {
    throw ValidationError("account is inactive: " + request.account_id);
  }

  ledger_.registerInstrument(request.symbol);

  domain::Order order;
  order.account_id = request.account_id;
  order.symbol = request.symbol;
  order.side = request.side;
  order.quantity = request.quantity;
  order.terms = request.terms;
  order.strategy_id = request.strategy_id;
  order.status = domain::OrderStatus::Pending;
  order.created_at_ms = clock_.now_ms();

  domain::Order stored = ledger_.addOrder(std::move(order));

  std::cout << "[OrderExecutionEngine] accepted order id=" << stored.id << " "
            << domain::sideToString(stored.side) << " " << stored.quantity << " "
            << stored.symbol << " "
            << domain::orderKindToString(domain::orderKindOf(stored.terms))
            << " account=" << stored.account_id
            << (stored.strategy_id ? " strategy=" + std::to_string(*stored.strategy_id)
                                   : std::string{})
            << "\n";

  audit_.publishOrderUpdate(stored, domain::OrderStatus::Pending);
  return stored;
}

// -----------------------------------------------------------------------------
// cancelOrder()
// -----------------------------------------------------------------------------
bool OrderExecutionEngine::cancelOrder(domain::OrderId id, const std::string& reason) {
  const auto owner = ledger_.orderAccount(id);
  if (!owner) {
    return false;
  }

  struct CancelOutcome {
    bool cancelled{false};
    domain::Order order;
    domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  };

  CancelOutcome outcome = ledger_.withAccount(*owner, [&](AccountBook& book) {
    CancelOutcome result;
    auto it = book.orders.find(id);
    if (it == book.orders.end() || domain::isTerminal(it->second.status)) {
      return result;
    }
    result.previous_status = it->second.status;
    it->second.status = domain::OrderStatus::Cancelled;
    it->second.status_reason = reason;
    result.cancelled = true;
    result.order = it->second;
    return result;
  });

  if (!outcome.cancelled) {
    return false;
  }
  std::cout << "[OrderExecutionEngine] cancelled order id=" << id << " ("
            << reason << ")\n";
  audit_.publishOrderUpdate(outcome.order, outcome.previous_status);
  return true;
}

// -----------------------------------------------------------------------------
// processOrder()
// -----------------------------------------------------------------------------
FillResult OrderExecutionEngine::processOrder(const domain::Order& order) {
  if (domain::isTerminal(order.status)) {
    return FillResult::AlreadyTerminal;
  }

  const auto quote = cache_.get(order.symbol);
  if (!quote) {
    return FillResult::QuoteUnavailable;
  }
  if (clock_.now_ms() - quote->as_of_ms > settings_.max_quote_age_ms) {
    return FillResult::QuoteStale;
  }
  if (!isTriggered(order, quote->price)) {
    return FillResult::NotTriggered;
  }

  const double quantity = fill_policy_->fillQuantity(order, *quote);
  if (quantity <= domain::kQuantityEpsilon) {
    return FillResult::NotTriggered;
  }
  return commitFill(order, quantity, quote->price);
}

// -----------------------------------------------------------------------------
// commitFill()
// -----------------------------------------------------------------------------
// Everything that can fail (validation, allocation of the trade slot and
// the position node) happens before the first field is written, so the
// account either receives the whole fill or none of it.
// -----------------------------------------------------------------------------
FillResult OrderExecutionEngine::commitFill(const domain::Order& snapshot,
                                            double quantity, double price) {
  const std::int64_t now = clock_.now_ms();

  CommitOutcome outcome = ledger_.withAccount(snapshot.account_id, [&](AccountBook& book) {
    CommitOutcome result;
    auto it = book.orders.find(snapshot.id);
    if (it == book.orders.end() || domain::isTerminal(it->second.status)) {
      std::cerr << "[OrderExecutionEngine] WARNING: order id=" << snapshot.id
                << " is no longer working, fill skipped\n";
      return result;
    }

    domain::Order& order = it->second;
    result.previous_status = order.status;
    const double fill_quantity = std::min(quantity, order.remaining());
    const double notional = fill_quantity * price;
    auto held = book.positions.find(order.symbol);

    std::string reject_reason;
    if (order.side == domain::Side::Buy) {
      if (book.account.cash_balance + kCashEpsilon < notional) {
        std::ostringstream reason;
        reason << "insufficient cash: required " << notional << ", available "
               << book.account.cash_balance;
        reject_reason = reason.str();
      }
    } else {
      const double held_quantity = held != book.positions.end() ? held->second.quantity : 0.0;
      if (held_quantity + domain::kQuantityEpsilon < fill_quantity) {
        std::ostringstream reason;
        reason << "insufficient position: required " << fill_quantity << ", held "
               << held_quantity;
        reject_reason = reason.str();
      }
    }

    if (!reject_reason.empty()) {
      order.status = domain::OrderStatus::Rejected;
      order.status_reason = reject_reason;
      result.result = FillResult::Rejected;
      result.order = order;
      return result;
    }

    domain::Position next = held != book.positions.end()
                                ? held->second
                                : domain::Position{order.account_id, order.symbol};
    const double realized = applyFillToPosition(next, order.side, fill_quantity, price);

    domain::Order updated = order;
    const double previously_filled = updated.filled_quantity;
    updated.filled_quantity = previously_filled + fill_quantity;
    updated.filled_price =
        previously_filled > 0.0 && updated.filled_price
            ? (previously_filled * *updated.filled_price + fill_quantity * price) /
                  updated.filled_quantity
            : price;
    updated.filled_at_ms = now;
    updated.status = updated.remaining() <= domain::kQuantityEpsilon
                         ? domain::OrderStatus::Filled
                         : domain::OrderStatus::PartiallyFilled;

    if (!domain::isLegalTransition(order.status, updated.status)) {
      std::cerr << "[OrderExecutionEngine] WARNING: illegal transition for order id="
                << order.id << " " << domain::orderStatusToString(order.status)
                << " -> " << domain::orderStatusToString(updated.status) << "\n";
      return result;
    }

    domain::Trade trade;
    trade.order_id = order.id;
    trade.account_id = order.account_id;
    trade.symbol = order.symbol;
    trade.side = order.side;
    trade.quantity = fill_quantity;
    trade.price = price;
    trade.realized_pnl = realized;
    trade.timestamp_ms = now;

    book.trades.reserve(book.trades.size() + 1);
    domain::Position& slot = book.positions[order.symbol];
    trade.id = ledger_.tradeIds().next_id();

    // Commit.
    if (order.side == domain::Side::Buy) {
      book.account.cash_balance = std::max(0.0, book.account.cash_balance - notional);
    } else {
      book.account.cash_balance += notional;
    }
    book.account.realized_pnl += realized;
    if (next.quantity <= domain::kQuantityEpsilon) {
      book.positions.erase(order.symbol);
    } else {
      slot = std::move(next);
    }
    book.trades.push_back(trade);
    order = updated;

    result.result = order.status == domain::OrderStatus::Filled
                        ? FillResult::Filled
                        : FillResult::PartiallyFilled;
    result.order = order;
    result.trade = trade;
    return result;
  });

  switch (outcome.result) {
    case FillResult::Filled:
    case FillResult::PartiallyFilled:
      std::cout << "[OrderExecutionEngine] " << fillResultToString(outcome.result)
                << " order id=" << outcome.order.id << " "
                << domain::sideToString(outcome.order.side) << " "
                << outcome.trade->quantity << " " << outcome.order.symbol << " @ "
                << outcome.trade->price << " account=" << outcome.order.account_id
                << "\n";
      audit_.publishTrade(*outcome.trade);
      audit_.publishOrderUpdate(outcome.order, outcome.previous_status);
      break;
    case FillResult::Rejected:
      std::cerr << "[OrderExecutionEngine] WARNING: rejected order id="
                << outcome.order.id << ": " << outcome.order.status_reason << "\n";
      audit_.publishOrderUpdate(outcome.order, outcome.previous_status);
      break;
    default:
      break;
  }
  return outcome.result;
}

// -----------------------------------------------------------------------------
// runPass()
// -----------------------------------------------------------------------------
ExecutionReport OrderExecutionEngine::runPass() {
  ExecutionReport report;
  const auto orders = ledger_.openOrders();

  for (const auto& order : orders) {
    ++report.examined;
    try {
      switch (processOrder(order)) {
        case FillResult::Filled:
          ++report.filled;
          break;
        case FillResult::PartiallyFilled:
          ++report.partially_filled;
          break;
        case FillResult::Rejected:
          ++report.rejected;
          break;
        case FillResult::NotTriggered:
        case FillResult::QuoteUnavailable:
        case FillResult::QuoteStale:
          ++report.waiting;
          break;
        case FillResult::AlreadyTerminal:
          break;
      }
    } catch (const StorageUnavailableError&) {
      throw;
    } catch (const std::exception& e) {
      ++report.errors;
      std::cerr << "[OrderExecutionEngine] ERROR: order id=" << order.id << ": "
                << e.what() << "\n";
    }
  }
  return report;
}

JobOutcome OrderExecutionEngine::tick(const JobContext& /*context*/) {
  const ExecutionReport report = runPass();

  std::ostringstream summary;
  summary << "examined=" << report.examined << " filled=" << report.filled
          << " partial=" << report.partially_filled
          << " rejected=" << report.rejected << " waiting=" << report.waiting
          << " errors=" << report.errors;
  if (report.examined > 0) {
    std::cout << "[OrderExecutionEngine] " << summary.str() << "\n";
  }
  return JobOutcome::success(report.examined, report.errors, summary.str());
}

}  // namespace papertrade
