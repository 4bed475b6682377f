#include "papertrade/market/zmq_market_data_provider.hpp"

#include "papertrade/common/errors.hpp"

#include <algorithm>
#include <utility>

namespace papertrade {

namespace {

ProviderErrorKind kindFromWire(const std::string& code) {
  if (code == "not_found") return ProviderErrorKind::NotFound;
  if (code == "rate_limited") return ProviderErrorKind::RateLimited;
  if (code == "timeout") return ProviderErrorKind::Timeout;
  if (code == "bad_request" || code == "bad_response") {
    return ProviderErrorKind::BadResponse;
  }
  return ProviderErrorKind::Unavailable;
}

}  // namespace

ZmqMarketDataProvider::ZmqMarketDataProvider(std::string endpoint,
                                             std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {}

ZmqMarketDataProvider::~ZmqMarketDataProvider() {
  std::lock_guard lock(mutex_);
  socket_.reset();
}

void ZmqMarketDataProvider::resetSocketLocked() {
  socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout_.count()));
  socket_->set(zmq::sockopt::sndtimeo, static_cast<int>(timeout_.count()));
  socket_->connect(endpoint_);
}

// -----------------------------------------------------------------------------
// roundTrip()
// -----------------------------------------------------------------------------
// Sends one request and waits at most timeout_ for the reply. Any failure
// after the send leaves the REQ socket unusable, so it is dropped and the
// next call reconnects.
// -----------------------------------------------------------------------------
nlohmann::json ZmqMarketDataProvider::roundTrip(const nlohmann::json& request) {
  std::lock_guard lock(mutex_);
  if (!socket_) {
    resetSocketLocked();
  }

  const std::string payload = request.dump();
  zmq::message_t reply;
  try {
    auto sent = socket_->send(zmq::buffer(payload), zmq::send_flags::none);
    if (!sent.has_value()) {
      socket_.reset();
      throw ProviderError(ProviderErrorKind::Timeout,
                          "send timed out to " + endpoint_);
    }
    auto received = socket_->recv(reply, zmq::recv_flags::none);
    if (!received.has_value()) {
      socket_.reset();
      throw ProviderError(ProviderErrorKind::Timeout,
                          "no reply from " + endpoint_ + " within " +
                              std::to_string(timeout_.count()) + "ms");
    }
  } catch (const zmq::error_t& e) {
    socket_.reset();
    throw ProviderError(ProviderErrorKind::Unavailable,
                        std::string("zmq error: ") + e.what());
  }

  nlohmann::json body;
  try {
    body = nlohmann::json::parse(reply.to_string());
  } catch (const nlohmann::json::exception& e) {
    throw ProviderError(ProviderErrorKind::BadResponse,
                        std::string("unparseable reply: ") + e.what());
  }

  if (body.value("status", std::string{}) != "ok") {
    throw ProviderError(kindFromWire(body.value("error", std::string{})),
                        body.value("message", std::string{"provider error"}));
  }
  return body;
}

domain::Quote ZmqMarketDataProvider::fetchQuote(const domain::Symbol& symbol) {
  nlohmann::json request;
  request["type"] = "quote";
  request["symbol"] = symbol;

  const nlohmann::json body = roundTrip(request);
  try {
    domain::Quote quote;
    quote.symbol = symbol;
    quote.price = body.at("price").get<double>();
    quote.as_of_ms = body.at("timestamp_ms").get<std::int64_t>();
    quote.volume = body.value("volume", 0.0);
    quote.source = body.value("source", name());
    return quote;
  } catch (const nlohmann::json::exception& e) {
    throw ProviderError(ProviderErrorKind::BadResponse,
                        "malformed quote for " + symbol + ": " + e.what());
  }
}

std::vector<domain::Bar> ZmqMarketDataProvider::fetchHistory(
    const domain::Symbol& symbol, const HistoryRange& range) {
  nlohmann::json request;
  request["type"] = "history";
  request["symbol"] = symbol;
  request["from_ms"] = range.from_ms;
  request["to_ms"] = range.to_ms;
  request["interval"] = range.interval;

  const nlohmann::json body = roundTrip(request);
  std::vector<domain::Bar> bars;
  try {
    for (const auto& item : body.at("bars")) {
      domain::Bar bar;
      bar.timestamp_ms = item.at("timestamp_ms").get<std::int64_t>();
      bar.open = item.value("open", 0.0);
      bar.high = item.value("high", 0.0);
      bar.low = item.value("low", 0.0);
      bar.close = item.at("close").get<double>();
      bar.volume = item.value("volume", 0.0);
      bars.push_back(bar);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ProviderError(ProviderErrorKind::BadResponse,
                        "malformed history for " + symbol + ": " + e.what());
  }
  std::sort(bars.begin(), bars.end(), [](const domain::Bar& a, const domain::Bar& b) {
    return a.timestamp_ms < b.timestamp_ms;
  });
  return bars;
}

}  // namespace papertrade
