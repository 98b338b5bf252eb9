#include "predict/gateway/zmq_market_feed.hpp"

#include "predict/domain/errors.hpp"
#include "predict/storage/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace predict {

ZmqMarketFeed::ZmqMarketFeed(const ITimeProvider& clock, std::string endpoint,
                             std::int64_t retention_ms)
    : clock_(clock),
      endpoint_(std::move(endpoint)),
      retention_ms_(retention_ms) {}

ZmqMarketFeed::~ZmqMarketFeed() { stop(); }

void ZmqMarketFeed::start() {
  if (running_.load()) {
    return;
  }
  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);
  socket_->set(zmq::sockopt::subscribe, "");
  socket_->set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_->connect(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[ZmqMarketFeed] subscribed to " << endpoint_ << "\n";
}

void ZmqMarketFeed::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[ZmqMarketFeed] stopped.\n";
  }
  socket_.reset();
  context_.reset();
}

void ZmqMarketFeed::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_->recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[ZmqMarketFeed] CRITICAL: recv failed: " << e.what()
                << "\n";
      running_.store(false);
      break;
    }
    if (!result.has_value()) {
      continue;
    }
    applyMessage(msg.to_string());
  }
}

bool ZmqMarketFeed::applyMessage(const std::string& payload) {
  const auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    std::cerr << "[ZmqMarketFeed] WARNING: dropping non-JSON payload: "
              << payload << "\n";
    return false;
  }
  const std::string type = j.value("type", std::string("market"));
  const std::int64_t now = clock_.now_ms();

  if (type == "resolution") {
    auto r = codec::parseResolution(j, now);
    if (!r) {
      std::cerr << "[ZmqMarketFeed] WARNING: malformed resolution: " << payload
                << "\n";
      return false;
    }
    {
      std::lock_guard lock(mutex_);
      resolutions_[r->market_id] = CachedResolution{*r, now};
      auto it = quotes_.find(r->market_id);
      if (it != quotes_.end()) {
        it->second.resolved = true;
        it->second.outcome = r->outcome;
      }
    }
    return true;
  }

  if (type == "markets") {
    auto list = j.find("markets");
    if (list == j.end() || !list->is_array()) {
      std::cerr << "[ZmqMarketFeed] WARNING: 'markets' message without list\n";
      return false;
    }
    int applied = 0;
    for (const auto& item : *list) {
      if (auto q = codec::parseMarket(item, now)) {
        upsertMarket(std::move(*q));
        ++applied;
      }
    }
    return applied > 0;
  }

  if (type == "market") {
    auto q = codec::parseMarket(j, now);
    if (!q) {
      std::cerr << "[ZmqMarketFeed] WARNING: market without id or prices: "
                << payload << "\n";
      return false;
    }
    upsertMarket(std::move(*q));
    return true;
  }

  std::cerr << "[ZmqMarketFeed] WARNING: unknown message type '" << type
            << "'\n";
  return false;
}

void ZmqMarketFeed::upsertMarket(domain::MarketQuote quote) {
  {
    std::lock_guard lock(mutex_);
    if (quote.resolved && quote.outcome &&
        resolutions_.count(quote.market_id) == 0) {
      resolutions_[quote.market_id] = CachedResolution{
          domain::Resolution{quote.market_id, *quote.outcome,
                             quote.updated_at_ms},
          clock_.now_ms()};
    }
    quotes_[quote.market_id] = std::move(quote);
  }
  data_cv_.notify_all();
}

std::vector<domain::MarketQuote> ZmqMarketFeed::fetchMarkets(
    std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  evictExpiredLocked();
  if (!data_cv_.wait_for(lock, timeout, [this] { return !quotes_.empty(); })) {
    throw TransientIoError("no market data received from " + endpoint_ +
                           " within " + std::to_string(timeout.count()) +
                           "ms");
  }
  std::vector<domain::MarketQuote> out;
  out.reserve(quotes_.size());
  for (const auto& entry : quotes_) {
    out.push_back(entry.second);
  }
  return out;
}

std::vector<domain::Resolution> ZmqMarketFeed::fetchResolutions(
    const std::vector<std::string>& open_market_ids,
    std::chrono::milliseconds /*timeout*/) {
  std::lock_guard lock(mutex_);
  evictExpiredLocked();
  std::vector<domain::Resolution> out;
  for (const auto& id : open_market_ids) {
    auto it = resolutions_.find(id);
    if (it != resolutions_.end()) {
      out.push_back(it->second.resolution);
    }
  }
  return out;
}

void ZmqMarketFeed::evictExpiredLocked() {
  if (retention_ms_ <= 0) {
    return;
  }
  const std::int64_t cutoff = clock_.now_ms() - retention_ms_;
  std::size_t evicted = 0;
  for (auto it = quotes_.begin(); it != quotes_.end();) {
    if (it->second.updated_at_ms < cutoff) {
      it = quotes_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  for (auto it = resolutions_.begin(); it != resolutions_.end();) {
    if (it->second.received_at_ms < cutoff) {
      it = resolutions_.erase(it);
      ++evicted;
    } else {
      ++it;
    }
  }
  if (evicted > 0) {
    std::cout << "[ZmqMarketFeed] evicted " << evicted
              << " expired quote/resolution entries.\n";
  }
}

std::size_t ZmqMarketFeed::marketCount() const {
  std::lock_guard lock(mutex_);
  return quotes_.size();
}

}  // namespace predict
