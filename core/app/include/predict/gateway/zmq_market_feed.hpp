#pragma once

#include "predict/io/market_data_source.hpp"
#include "predict/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace predict {

// -----------------------------------------------------------------------------
// ZmqMarketFeed — live IMarketDataSource over a ZeroMQ SUB socket
// -----------------------------------------------------------------------------
//
// @brief  A background thread subscribes to a venue bridge publishing JSON
//         and keeps the latest quote per market plus every resolution seen.
//         fetchMarkets() / fetchResolutions() read that cache.
//
// @details
// Accepted messages (one JSON object per ZMQ message):
//
//   {"type": "market", "market_id": "m1", "yes_price": 0.6, ...}
//   {"type": "markets", "markets": [ {...}, {...} ]}
//   {"type": "resolution", "market_id": "m1", "outcome": "YES",
//    "resolved_at": "2024-05-01T12:00:00Z"}
//
// Market objects use the lenient codec::parseMarket shapes. A quote
// without a timestamp is stamped with the clock at arrival. A market
// message that itself reports an outcome also records a resolution.
// Malformed messages are logged and dropped; the recv loop never dies on
// bad input.
//
// fetchMarkets(timeout) waits up to `timeout` for the first quote and
// throws TransientIoError if none has arrived, so the retry policy covers a
// bridge that is still starting.
//
// Retention: each fetch first evicts quotes whose updated_at is more than
// retention_ms behind the clock, and resolutions that arrived more than
// retention_ms ago. A resolution stays servable for the whole window, so a
// tick that fails after fetching it can fetch it again.
//
// Thread model:
//   start() spawns the recv thread; stop() (and the destructor) joins it
//   within kRecvTimeoutMs. The cache is guarded by a mutex. applyMessage()
//   is public so the parsing can be driven without a socket.
// -----------------------------------------------------------------------------
class ZmqMarketFeed final : public IMarketDataSource {
 public:
  static constexpr std::int64_t kDefaultRetentionMs = 7 * 24 * 3600 * 1000LL;

  ZmqMarketFeed(const ITimeProvider& clock, std::string endpoint,
                std::int64_t retention_ms = kDefaultRetentionMs);
  ~ZmqMarketFeed() override;

  ZmqMarketFeed(const ZmqMarketFeed&) = delete;
  ZmqMarketFeed& operator=(const ZmqMarketFeed&) = delete;

  void start();
  void stop();

  std::vector<domain::MarketQuote> fetchMarkets(
      std::chrono::milliseconds timeout) override;

  std::vector<domain::Resolution> fetchResolutions(
      const std::vector<std::string>& open_market_ids,
      std::chrono::milliseconds timeout) override;

  // Parses and applies one payload. Returns false if it was rejected.
  bool applyMessage(const std::string& payload);

  std::size_t marketCount() const;

 private:
  static constexpr int kRecvTimeoutMs = 100;

  struct CachedResolution {
    domain::Resolution resolution;
    std::int64_t received_at_ms{0};
  };

  void run();
  void upsertMarket(domain::MarketQuote quote);
  void evictExpiredLocked();

  const ITimeProvider& clock_;
  std::string endpoint_;
  const std::int64_t retention_ms_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex mutex_;
  std::condition_variable data_cv_;
  std::map<std::string, domain::MarketQuote> quotes_;
  std::map<std::string, CachedResolution> resolutions_;
};

}  // namespace predict
