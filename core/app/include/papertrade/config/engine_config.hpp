#pragma once

#include "papertrade/domain/account.hpp"
#include "papertrade/domain/instrument.hpp"
#include "papertrade/domain/strategy.hpp"
#include "papertrade/market/simulated_market_data_provider.hpp"
#include "papertrade/scheduler/job_scheduler.hpp"
#include "papertrade/time/market_calendar.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace papertrade {

// Job names shared by the engine, the configuration file and the IPC
// RUN command.
inline constexpr const char* kPriceFeedJob = "price_feed";
inline constexpr const char* kOrderExecutionJob = "order_execution";
inline constexpr const char* kPositionValuationJob = "position_valuation";
inline constexpr const char* kStrategySignalsJob = "strategy_signals";

struct RateLimitConfig {
  double capacity{5.0};
  double refill_per_second{1.0};
};

struct ProviderConfig {
  // "simulated" or "zmq".
  std::string type{"simulated"};
  std::string endpoint{"tcp://127.0.0.1:5560"};
  std::int64_t timeout_ms{2'000};
  RateLimitConfig rate_limit;
  SimulatedProviderConfig simulated;
};

struct FillPolicyConfig {
  // "full" or "liquidity_capped".
  std::string type{"full"};
  double max_fill_quantity{0.0};
};

struct ExecutionConfig {
  std::int64_t max_quote_age_ms{5 * 60'000};
  FillPolicyConfig fill_policy;
};

struct IpcConfig {
  // An empty cmd_endpoint disables the IPC server.
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct StorageConfig {
  // Empty disables ledger persistence.
  std::string snapshot_path;
  std::size_t audit_capacity{10'000};
  std::size_t history_capacity{256};
};

struct AccountSeed {
  domain::AccountId id;
  double cash{0.0};
  std::optional<domain::StrategyId> strategy_id;
  bool auto_trade{false};
};

// -----------------------------------------------------------------------------
// EngineConfig — everything the daemon reads at start-up
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct produced by loadConfig() / parseConfig().
//
// @details
// Every field has a usable default, so an empty JSON object (or no file at
// all) yields a runnable engine with the simulated provider, the four jobs
// at their default cadences and no accounts.
//
// Default job table:
//   price_feed          60s, market hours only
//   order_execution      5s
//   position_valuation  30s
//   strategy_signals   300s, market hours only
//
// Validation happens here, once. Components receiving an EngineConfig can
// assume positive cadences, a known provider type, a known fill policy and
// strategies that passed StrategyRepository::validate().
// -----------------------------------------------------------------------------
struct EngineConfig {
  MarketCalendarConfig market;
  std::vector<JobSpec> jobs;
  ProviderConfig provider;
  ExecutionConfig execution;
  IpcConfig ipc;
  StorageConfig storage;
  std::vector<AccountSeed> accounts;
  std::vector<domain::Symbol> watchlist;
  std::vector<domain::Strategy> strategies;

  // The job table with defaults for any job the file did not mention.
  static std::vector<JobSpec> defaultJobs();

  // Lookup by name in jobs; nullptr if absent.
  const JobSpec* job(const std::string& name) const;
};

// Reads and parses a JSON configuration file. Throws ConfigError when the
// file cannot be read or its content is invalid.
EngineConfig loadConfig(const std::string& path);

// Parses an already decoded document. Throws ConfigError naming the
// offending key.
EngineConfig parseConfig(const nlohmann::json& document);

// Parses one strategy definition:
//   {"id": 1, "name": "...", "kind": "rsi_reversion", "universe": [...],
//    "params": {...}, "sizing": {"type": "percent_of_equity", "percent": 10},
//    "confidence_threshold": 0.6, "max_positions": 10, "active": true}
domain::Strategy parseStrategy(const nlohmann::json& node);

// "HH:MM" → minute of day. Throws ConfigError.
int parseMinuteOfDay(const std::string& text);

// "YYYY-MM-DD" → CivilDate. Throws ConfigError.
CivilDate parseCivilDate(const std::string& text);

}  // namespace papertrade
