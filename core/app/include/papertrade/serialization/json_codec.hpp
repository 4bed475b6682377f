#pragma once

#include "papertrade/domain/account.hpp"
#include "papertrade/domain/account_snapshot.hpp"
#include "papertrade/domain/instrument.hpp"
#include "papertrade/domain/job_run.hpp"
#include "papertrade/domain/order.hpp"
#include "papertrade/domain/position.hpp"
#include "papertrade/domain/quote.hpp"
#include "papertrade/domain/trade.hpp"
#include "papertrade/domain/trading_signal.hpp"
#include "papertrade/storage/ledger.hpp"

#include <nlohmann/json.hpp>

// -----------------------------------------------------------------------------
// JSON encoding of domain values
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json adl_serializer hooks for the types that cross a
//         process boundary: IPC replies, telemetry, ledger snapshots.
//
// @details
// Enums are written as their upper-case names (ORDER status "FILLED", side
// "BUY", kind "LIMIT"). Empty optionals are written as null and read back
// from null or a missing key. Order terms are flattened into the order
// object: "kind" plus "limit_price" or "stop_price".
//
// from_json throws ValidationError for unknown enum names or a missing
// price on a limit/stop order; malformed JSON types surface as
// nlohmann::json::exception and are translated by the callers.
// -----------------------------------------------------------------------------

namespace papertrade {
namespace domain {

void to_json(nlohmann::json& j, const Instrument& instrument);
void from_json(const nlohmann::json& j, Instrument& instrument);

void to_json(nlohmann::json& j, const Quote& quote);

void to_json(nlohmann::json& j, const Account& account);
void from_json(const nlohmann::json& j, Account& account);

void to_json(nlohmann::json& j, const Position& position);
void from_json(const nlohmann::json& j, Position& position);

void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

// Order submission as received on the command socket:
//   {"account_id": "a1", "symbol": "AAPL", "side": "BUY", "quantity": 10,
//    "kind": "LIMIT", "limit_price": 150.0}
void from_json(const nlohmann::json& j, OrderRequest& request);

void to_json(nlohmann::json& j, const Trade& trade);
void from_json(const nlohmann::json& j, Trade& trade);

void to_json(nlohmann::json& j, const TradingSignal& signal);
void to_json(nlohmann::json& j, const JobRun& run);
void to_json(nlohmann::json& j, const AccountSnapshot& snapshot);
void to_json(nlohmann::json& j, const AccountPerformance& performance);

}  // namespace domain

void to_json(nlohmann::json& j, const AccountState& state);
void from_json(const nlohmann::json& j, AccountState& state);

void to_json(nlohmann::json& j, const LedgerState& state);
void from_json(const nlohmann::json& j, LedgerState& state);

}  // namespace papertrade
