#pragma once

#include "papertrade/market/i_market_data_provider.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace papertrade {

// -----------------------------------------------------------------------------
// ZmqMarketDataProvider — request/reply client for an external data service
// -----------------------------------------------------------------------------
//
// @brief  Fetches quotes and history from a data service over a ZeroMQ REQ
//         socket using JSON messages.
//
// @details
// Wire format (one JSON object per frame):
//
//   → {"type":"quote","symbol":"AAPL"}
//   ← {"status":"ok","symbol":"AAPL","price":189.5,"timestamp_ms":...,
//      "volume":1200,"source":"feed"}
//
//   → {"type":"history","symbol":"AAPL","from_ms":...,"to_ms":...,
//      "interval":"1d"}
//   ← {"status":"ok","bars":[{"timestamp_ms":...,"open":...,"high":...,
//      "low":...,"close":...,"volume":...}, ...]}
//
//   ← {"status":"error","error":"not_found"|"rate_limited"|...,
//      "message":"..."}
//
// Every call is bounded by the configured timeout (ZMQ_SNDTIMEO and
// ZMQ_RCVTIMEO). A REQ socket that timed out waiting for a reply is stuck in
// the "expecting reply" state, so the socket is discarded and recreated
// before the next request. A missing reply is reported as
// ProviderError(Timeout); malformed JSON or missing fields as BadResponse.
//
// Thread model:
//   REQ sockets are strictly request/reply and not thread-safe, so a
//   std::mutex serializes whole round trips.
// -----------------------------------------------------------------------------
class ZmqMarketDataProvider final : public IMarketDataProvider {
 public:
  ZmqMarketDataProvider(std::string endpoint, std::chrono::milliseconds timeout);
  ~ZmqMarketDataProvider() override;

  ZmqMarketDataProvider(const ZmqMarketDataProvider&) = delete;
  ZmqMarketDataProvider& operator=(const ZmqMarketDataProvider&) = delete;

  domain::Quote fetchQuote(const domain::Symbol& symbol) override;

  std::vector<domain::Bar> fetchHistory(const domain::Symbol& symbol,
                                        const HistoryRange& range) override;

  std::string name() const override { return "zmq"; }

 private:
  nlohmann::json roundTrip(const nlohmann::json& request);
  void resetSocketLocked();

  const std::string endpoint_;
  const std::chrono::milliseconds timeout_;

  std::mutex mutex_;
  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace papertrade
