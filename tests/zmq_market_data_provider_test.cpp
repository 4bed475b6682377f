// =============================================================================
// zmq_market_data_provider_test.cpp
// =============================================================================
// Unit tests for papertrade::ZmqMarketDataProvider against an in-process
// data service bound on the loopback interface.
//
// Validates:
//   - Quote and history requests/replies on the JSON wire format
//   - Wire error codes map to ProviderErrorKind
//   - Malformed replies raise BadResponse
//   - A missing reply raises Timeout and the next call uses a fresh socket
// =============================================================================

#include "papertrade/common/errors.hpp"
#include "papertrade/market/zmq_market_data_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>
#include <zmq_addon.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using papertrade::ProviderError;
using papertrade::ProviderErrorKind;
using papertrade::ZmqMarketDataProvider;

namespace {

// -----------------------------------------------------------------------------
// FakeDataService — ROUTER peer answering through a handler
// -----------------------------------------------------------------------------
// A ROUTER socket (rather than REP) lets the service leave a request
// unanswered and still serve the next one. The handler returns the reply
// frame, or nullopt to stay silent.
// -----------------------------------------------------------------------------
class FakeDataService {
 public:
  using Handler = std::function<std::optional<std::string>(const nlohmann::json&)>;

  explicit FakeDataService(Handler handler)
      : handler_(std::move(handler)), socket_(context_, zmq::socket_type::router) {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.set(zmq::sockopt::rcvtimeo, 20);
    socket_.bind("tcp://127.0.0.1:*");
    endpoint_ = socket_.get(zmq::sockopt::last_endpoint);
    worker_ = std::thread([this] { serve(); });
  }

  ~FakeDataService() {
    running_.store(false);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  FakeDataService(const FakeDataService&) = delete;
  FakeDataService& operator=(const FakeDataService&) = delete;

  const std::string& endpoint() const { return endpoint_; }

  std::vector<nlohmann::json> requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

 private:
  void serve() {
    while (running_.load()) {
      std::vector<zmq::message_t> frames;
      auto received = zmq::recv_multipart(socket_, std::back_inserter(frames));
      if (!received.has_value() || frames.size() < 3) {
        continue;
      }
      const auto request = nlohmann::json::parse(frames.back().to_string());
      {
        std::lock_guard lock(mutex_);
        requests_.push_back(request);
      }
      const auto reply = handler_(request);
      if (!reply.has_value()) {
        continue;
      }
      socket_.send(frames[0], zmq::send_flags::sndmore);
      socket_.send(zmq::message_t{}, zmq::send_flags::sndmore);
      socket_.send(zmq::buffer(*reply), zmq::send_flags::none);
    }
  }

  Handler handler_;
  zmq::context_t context_{1};
  zmq::socket_t socket_;
  std::string endpoint_;
  std::atomic<bool> running_{true};
  std::thread worker_;

  mutable std::mutex mutex_;
  std::vector<nlohmann::json> requests_;
};

std::string okQuote(const std::string& symbol, double price) {
  nlohmann::json reply;
  reply["status"] = "ok";
  reply["symbol"] = symbol;
  reply["price"] = price;
  reply["timestamp_ms"] = 1'700'000'000'000LL;
  reply["volume"] = 1200.0;
  reply["source"] = "feed";
  return reply.dump();
}

ProviderErrorKind kindOf(ZmqMarketDataProvider& provider, const std::string& symbol) {
  try {
    provider.fetchQuote(symbol);
  } catch (const ProviderError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected ProviderError for " << symbol;
  return ProviderErrorKind::Unavailable;
}

constexpr std::chrono::milliseconds kTimeout{300};

}  // namespace

// -----------------------------------------------------------------------------
// 1. Happy path for both request types.
// -----------------------------------------------------------------------------
TEST(ZmqMarketDataProviderTest, FetchQuoteParsesReply) {
  FakeDataService service([](const nlohmann::json& request) -> std::optional<std::string> {
    return okQuote(request.at("symbol").get<std::string>(), 189.5);
  });
  ZmqMarketDataProvider provider(service.endpoint(), kTimeout);

  const auto quote = provider.fetchQuote("AAPL");
  EXPECT_EQ(quote.symbol, "AAPL");
  EXPECT_DOUBLE_EQ(quote.price, 189.5);
  EXPECT_EQ(quote.as_of_ms, 1'700'000'000'000LL);
  EXPECT_DOUBLE_EQ(quote.volume, 1200.0);
  EXPECT_EQ(quote.source, "feed");

  const auto requests = service.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].at("type"), "quote");
  EXPECT_EQ(requests[0].at("symbol"), "AAPL");
}

TEST(ZmqMarketDataProviderTest, FetchHistorySortsBars) {
  FakeDataService service([](const nlohmann::json& /*request*/) -> std::optional<std::string> {
    nlohmann::json reply;
    reply["status"] = "ok";
    reply["bars"] = nlohmann::json::array();
    reply["bars"].push_back({{"timestamp_ms", 3000}, {"close", 12.0}});
    reply["bars"].push_back({{"timestamp_ms", 1000}, {"close", 10.0}, {"open", 9.5}});
    reply["bars"].push_back({{"timestamp_ms", 2000}, {"close", 11.0}});
    return reply.dump();
  });
  ZmqMarketDataProvider provider(service.endpoint(), kTimeout);

  papertrade::HistoryRange range;
  range.from_ms = 1000;
  range.to_ms = 3000;
  range.interval = "1h";
  const auto bars = provider.fetchHistory("MSFT", range);

  ASSERT_EQ(bars.size(), 3u);
  EXPECT_EQ(bars[0].timestamp_ms, 1000);
  EXPECT_DOUBLE_EQ(bars[0].open, 9.5);
  EXPECT_DOUBLE_EQ(bars[2].close, 12.0);

  const auto request = service.requests().at(0);
  EXPECT_EQ(request.at("type"), "history");
  EXPECT_EQ(request.at("from_ms"), 1000);
  EXPECT_EQ(request.at("to_ms"), 3000);
  EXPECT_EQ(request.at("interval"), "1h");
}

// -----------------------------------------------------------------------------
// 2. The symbol doubles as the wire error code the service answers with.
// -----------------------------------------------------------------------------
TEST(ZmqMarketDataProviderTest, WireErrorCodesMapToKinds) {
  FakeDataService service([](const nlohmann::json& request) -> std::optional<std::string> {
    nlohmann::json reply;
    reply["status"] = "error";
    reply["error"] = request.at("symbol");
    reply["message"] = "nope";
    return reply.dump();
  });
  ZmqMarketDataProvider provider(service.endpoint(), kTimeout);

  EXPECT_EQ(kindOf(provider, "not_found"), ProviderErrorKind::NotFound);
  EXPECT_EQ(kindOf(provider, "rate_limited"), ProviderErrorKind::RateLimited);
  EXPECT_EQ(kindOf(provider, "timeout"), ProviderErrorKind::Timeout);
  EXPECT_EQ(kindOf(provider, "bad_request"), ProviderErrorKind::BadResponse);
  EXPECT_EQ(kindOf(provider, "bad_response"), ProviderErrorKind::BadResponse);
  EXPECT_EQ(kindOf(provider, "maintenance"), ProviderErrorKind::Unavailable);
}

TEST(ZmqMarketDataProviderTest, MalformedRepliesAreBadResponse) {
  FakeDataService service([](const nlohmann::json& request) -> std::optional<std::string> {
    const auto symbol = request.at("symbol").get<std::string>();
    if (symbol == "GARBAGE") {
      return std::string("{not json");
    }
    if (symbol == "NOPRICE") {
      return std::string(R"({"status":"ok","timestamp_ms":1})");
    }
    return std::string(R"({"status":"ok","bars":[{"close":1.0}]})");
  });
  ZmqMarketDataProvider provider(service.endpoint(), kTimeout);

  EXPECT_EQ(kindOf(provider, "GARBAGE"), ProviderErrorKind::BadResponse);
  EXPECT_EQ(kindOf(provider, "NOPRICE"), ProviderErrorKind::BadResponse);

  try {
    provider.fetchHistory("BARS", papertrade::HistoryRange{});
    FAIL() << "expected ProviderError";
  } catch (const ProviderError& e) {
    EXPECT_EQ(e.kind(), ProviderErrorKind::BadResponse);
  }
}

// -----------------------------------------------------------------------------
// 3. The service swallows the first request. The provider reports Timeout
//    and the following request succeeds.
// Why: A REQ socket left waiting for a reply refuses to send again; only a
//      recreated socket can talk to the service.
// -----------------------------------------------------------------------------
TEST(ZmqMarketDataProviderTest, TimeoutRecreatesSocket) {
  std::atomic<int> seen{0};
  FakeDataService service([&seen](const nlohmann::json& request) -> std::optional<std::string> {
    if (seen.fetch_add(1) == 0) {
      return std::nullopt;
    }
    return okQuote(request.at("symbol").get<std::string>(), 42.0);
  });
  ZmqMarketDataProvider provider(service.endpoint(), kTimeout);

  EXPECT_EQ(kindOf(provider, "AAPL"), ProviderErrorKind::Timeout);

  const auto quote = provider.fetchQuote("AAPL");
  EXPECT_DOUBLE_EQ(quote.price, 42.0);
  EXPECT_EQ(service.requests().size(), 2u);
}
