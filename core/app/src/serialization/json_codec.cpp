#include "papertrade/serialization/json_codec.hpp"

#include "papertrade/common/errors.hpp"

#include <string>

namespace papertrade {

using nlohmann::json;

namespace {

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  } else {
    j[key] = nullptr;
  }
}

template <typename T>
std::optional<T> getOptional(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->template get<T>();
}

template <typename T>
T valueOr(const json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->template get<T>();
}

domain::Side parseSide(const json& j) {
  const auto text = j.at("side").get<std::string>();
  auto side = domain::sideFromString(text);
  if (!side) {
    throw ValidationError("unknown side \"" + text + "\"");
  }
  return *side;
}

// Reads "kind" plus the matching price field. A missing kind means MARKET.
domain::OrderTerms parseTerms(const json& j) {
  const auto kind = valueOr<std::string>(j, "kind", "MARKET");
  if (kind == "MARKET") {
    return domain::MarketTerms{};
  }
  if (kind == "LIMIT") {
    auto price = getOptional<double>(j, "limit_price");
    if (!price) throw ValidationError("limit order requires limit_price");
    return domain::LimitTerms{*price};
  }
  if (kind == "STOP") {
    auto price = getOptional<double>(j, "stop_price");
    if (!price) throw ValidationError("stop order requires stop_price");
    return domain::StopTerms{*price};
  }
  throw ValidationError("unknown order kind \"" + kind + "\"");
}

void writeTerms(json& j, const domain::OrderTerms& terms) {
  j["kind"] = domain::orderKindToString(domain::orderKindOf(terms));
  if (const auto* limit = std::get_if<domain::LimitTerms>(&terms)) {
    j["limit_price"] = limit->limit_price;
  } else if (const auto* stop = std::get_if<domain::StopTerms>(&terms)) {
    j["stop_price"] = stop->stop_price;
  }
}

}  // namespace

namespace domain {

void to_json(json& j, const Instrument& instrument) {
  j = json{{"symbol", instrument.symbol},
           {"exchange", instrument.exchange},
           {"currency", instrument.currency}};
}

void from_json(const json& j, Instrument& instrument) {
  instrument.symbol = j.at("symbol").get<std::string>();
  instrument.exchange = valueOr<std::string>(j, "exchange", "");
  instrument.currency = valueOr<std::string>(j, "currency", "USD");
}

void to_json(json& j, const Quote& quote) {
  j = json{{"symbol", quote.symbol},
           {"price", quote.price},
           {"as_of_ms", quote.as_of_ms},
           {"source", quote.source},
           {"volume", quote.volume}};
}

void to_json(json& j, const Account& account) {
  j = json{{"id", account.id},
           {"cash_balance", account.cash_balance},
           {"initial_cash", account.initial_cash},
           {"realized_pnl", account.realized_pnl},
           {"auto_trade", account.auto_trade},
           {"active", account.active},
           {"created_at_ms", account.created_at_ms}};
  putOptional(j, "strategy_id", account.strategy_id);
}

void from_json(const json& j, Account& account) {
  account.id = j.at("id").get<std::string>();
  account.cash_balance = j.at("cash_balance").get<double>();
  account.initial_cash = valueOr(j, "initial_cash", account.cash_balance);
  account.realized_pnl = valueOr(j, "realized_pnl", 0.0);
  account.strategy_id = getOptional<StrategyId>(j, "strategy_id");
  account.auto_trade = valueOr(j, "auto_trade", false);
  account.active = valueOr(j, "active", true);
  account.created_at_ms = valueOr<std::int64_t>(j, "created_at_ms", 0);
}

void to_json(json& j, const Position& position) {
  j = json{{"account_id", position.account_id},
           {"symbol", position.symbol},
           {"quantity", position.quantity},
           {"average_entry_price", position.average_entry_price},
           {"realized_pnl", position.realized_pnl}};
  if (position.valuation) {
    const auto& v = *position.valuation;
    j["valuation"] = json{{"last_price", v.last_price},
                          {"market_value", v.market_value},
                          {"unrealized_pnl", v.unrealized_pnl},
                          {"priced_at_ms", v.priced_at_ms},
                          {"stale", v.stale}};
  } else {
    j["valuation"] = nullptr;
  }
}

void from_json(const json& j, Position& position) {
  position.account_id = j.at("account_id").get<std::string>();
  position.symbol = j.at("symbol").get<std::string>();
  position.quantity = j.at("quantity").get<double>();
  position.average_entry_price = j.at("average_entry_price").get<double>();
  position.realized_pnl = valueOr(j, "realized_pnl", 0.0);
  position.valuation.reset();
  if (auto it = j.find("valuation"); it != j.end() && !it->is_null()) {
    PositionValuation v;
    v.last_price = it->at("last_price").get<double>();
    v.market_value = it->at("market_value").get<double>();
    v.unrealized_pnl = it->at("unrealized_pnl").get<double>();
    v.priced_at_ms = it->at("priced_at_ms").get<std::int64_t>();
    v.stale = valueOr(*it, "stale", false);
    position.valuation = v;
  }
}

void to_json(json& j, const Order& order) {
  j = json{{"id", order.id},
           {"account_id", order.account_id},
           {"symbol", order.symbol},
           {"side", sideToString(order.side)},
           {"quantity", order.quantity},
           {"status", orderStatusToString(order.status)},
           {"status_reason", order.status_reason},
           {"created_at_ms", order.created_at_ms},
           {"filled_quantity", order.filled_quantity}};
  writeTerms(j, order.terms);
  putOptional(j, "filled_at_ms", order.filled_at_ms);
  putOptional(j, "filled_price", order.filled_price);
  putOptional(j, "strategy_id", order.strategy_id);
}

void from_json(const json& j, Order& order) {
  order.id = j.at("id").get<OrderId>();
  order.account_id = j.at("account_id").get<std::string>();
  order.symbol = j.at("symbol").get<std::string>();
  order.side = parseSide(j);
  order.quantity = j.at("quantity").get<double>();
  order.terms = parseTerms(j);

  const auto status_text = j.at("status").get<std::string>();
  auto status = orderStatusFromString(status_text);
  if (!status) {
    throw ValidationError("unknown order status \"" + status_text + "\"");
  }
  order.status = *status;
  order.status_reason = valueOr<std::string>(j, "status_reason", "");
  order.created_at_ms = j.at("created_at_ms").get<std::int64_t>();
  order.filled_at_ms = getOptional<std::int64_t>(j, "filled_at_ms");
  order.filled_price = getOptional<double>(j, "filled_price");
  order.filled_quantity = valueOr(j, "filled_quantity", 0.0);
  order.strategy_id = getOptional<StrategyId>(j, "strategy_id");
}

void from_json(const json& j, OrderRequest& request) {
  request.account_id = j.at("account_id").get<std::string>();
  request.symbol = j.at("symbol").get<std::string>();
  request.side = parseSide(j);
  request.quantity = j.at("quantity").get<double>();
  request.terms = parseTerms(j);
  request.strategy_id = getOptional<StrategyId>(j, "strategy_id");
}

void to_json(json& j, const Trade& trade) {
  j = json{{"id", trade.id},
           {"order_id", trade.order_id},
           {"account_id", trade.account_id},
           {"symbol", trade.symbol},
           {"side", sideToString(trade.side)},
           {"quantity", trade.quantity},
           {"price", trade.price},
           {"realized_pnl", trade.realized_pnl},
           {"timestamp_ms", trade.timestamp_ms}};
}

void from_json(const json& j, Trade& trade) {
  trade.id = j.at("id").get<TradeId>();
  trade.order_id = j.at("order_id").get<OrderId>();
  trade.account_id = j.at("account_id").get<std::string>();
  trade.symbol = j.at("symbol").get<std::string>();
  trade.side = parseSide(j);
  trade.quantity = j.at("quantity").get<double>();
  trade.price = j.at("price").get<double>();
  trade.realized_pnl = valueOr(j, "realized_pnl", 0.0);
  trade.timestamp_ms = j.at("timestamp_ms").get<std::int64_t>();
}

void to_json(json& j, const TradingSignal& signal) {
  j = json{{"id", signal.id},
           {"strategy_id", signal.strategy_id},
           {"symbol", signal.symbol},
           {"type", signalTypeToString(signal.type)},
           {"strength", signal.strength},
           {"confidence", signal.confidence},
           {"price", signal.price},
           {"reason", signal.reason},
           {"timestamp_ms", signal.timestamp_ms}};
}

void to_json(json& j, const JobRun& run) {
  j = json{{"job_name", run.job_name},
           {"trigger", jobTriggerToString(run.trigger)},
           {"started_at_ms", run.started_at_ms},
           {"outcome", jobResultToString(run.outcome)},
           {"items_processed", run.items_processed},
           {"items_failed", run.items_failed},
           {"summary", run.summary}};
  putOptional(j, "finished_at_ms", run.finished_at_ms);
  putOptional(j, "error", run.error);
}

void to_json(json& j, const AccountSnapshot& snapshot) {
  j = json{{"account_id", snapshot.account_id},
           {"timestamp_ms", snapshot.timestamp_ms},
           {"cash_balance", snapshot.cash_balance},
           {"portfolio_value", snapshot.portfolio_value},
           {"total_equity", snapshot.total_equity},
           {"unrealized_pnl", snapshot.unrealized_pnl},
           {"realized_pnl", snapshot.realized_pnl},
           {"position_count", snapshot.position_count},
           {"stale_positions", snapshot.stale_positions}};
}

void to_json(json& j, const AccountPerformance& performance) {
  j = performance.summary;
  j["initial_cash"] = performance.initial_cash;
  j["total_pnl"] = performance.total_pnl;
  j["total_return_percent"] = performance.total_return_percent;
  j["trade_count"] = performance.trade_count;
  j["holdings"] = performance.holdings;
}

}  // namespace domain

void to_json(json& j, const AccountState& state) {
  j = json{{"account", state.account},
           {"positions", state.positions},
           {"orders", state.orders},
           {"trades", state.trades}};
}

void from_json(const json& j, AccountState& state) {
  state.account = j.at("account").get<domain::Account>();
  state.positions = valueOr(j, "positions", std::vector<domain::Position>{});
  state.orders = valueOr(j, "orders", std::vector<domain::Order>{});
  state.trades = valueOr(j, "trades", std::vector<domain::Trade>{});
}

void to_json(json& j, const LedgerState& state) {
  j = json{{"instruments", state.instruments},
           {"accounts", state.accounts},
           {"next_order_id", state.next_order_id},
           {"next_trade_id", state.next_trade_id}};
}

void from_json(const json& j, LedgerState& state) {
  state.instruments = valueOr(j, "instruments", std::vector<domain::Instrument>{});
  state.accounts = valueOr(j, "accounts", std::vector<AccountState>{});
  state.next_order_id = valueOr<std::uint64_t>(j, "next_order_id", 1);
  state.next_trade_id = valueOr<std::uint64_t>(j, "next_trade_id", 1);
}

}  // namespace papertrade
