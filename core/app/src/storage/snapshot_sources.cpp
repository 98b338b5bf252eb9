#include "predict/storage/snapshot_sources.hpp"

#include "predict/time/time_utils.hpp"

#include <algorithm>

namespace predict {

namespace {

// Day keys of every UTC day overlapping [begin, begin + length).
std::vector<std::string> daysOverlapping(std::int64_t begin,
                                         std::int64_t length) {
  std::vector<std::string> out;
  const std::int64_t end = begin + std::max<std::int64_t>(1, length);
  for (std::int64_t day = time_utils::startOfDay(begin); day < end;
       day += time_utils::kMsPerDay) {
    out.push_back(time_utils::dayKey(day));
  }
  return out;
}

}  // namespace

// --- SnapshotNewsSource ------------------------------------------------------

SnapshotNewsSource::SnapshotNewsSource(const SnapshotStore& store,
                                       const ITimeProvider& clock,
                                       std::int64_t period_ms)
    : store_(store), clock_(clock), period_ms_(period_ms) {}

std::vector<domain::Article> SnapshotNewsSource::fetchSince(
    std::int64_t watermark_ms, std::chrono::milliseconds /*timeout*/) {
  std::vector<domain::Article> out;
  const std::int64_t begin = clock_.now_ms();
  const std::int64_t end = begin + std::max<std::int64_t>(1, period_ms_);
  for (const auto& day : daysOverlapping(begin, period_ms_)) {
    for (auto& article : store_.loadNews(day)) {
      if (article.published_at_ms <= watermark_ms) {
        continue;
      }
      // Not published yet in this period. Left out of seen_ so a later
      // period still serves it.
      if (article.published_at_ms >= end) {
        continue;
      }
      if (!seen_.insert(article.key()).second) {
        continue;
      }
      out.push_back(std::move(article));
    }
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const domain::Article& a, const domain::Article& b) {
                     return a.published_at_ms < b.published_at_ms;
                   });
  return out;
}

// --- SnapshotMarketDataSource ------------------------------------------------

SnapshotMarketDataSource::SnapshotMarketDataSource(const SnapshotStore& store,
                                                   const ITimeProvider& clock,
                                                   std::int64_t period_ms)
    : store_(store), clock_(clock), period_ms_(period_ms) {}

std::vector<domain::MarketQuote> SnapshotMarketDataSource::fetchMarkets(
    std::chrono::milliseconds /*timeout*/) {
  const std::int64_t now = clock_.now_ms();
  auto markets = store_.loadMarkets(time_utils::dayKey(now));
  for (auto& m : markets) {
    m.updated_at_ms = now;
  }
  return markets;
}

std::vector<domain::Resolution> SnapshotMarketDataSource::fetchResolutions(
    const std::vector<std::string>& open_market_ids,
    std::chrono::milliseconds /*timeout*/) {
  std::vector<domain::Resolution> out;
  if (open_market_ids.empty()) {
    return out;
  }
  const std::set<std::string> wanted(open_market_ids.begin(),
                                     open_market_ids.end());
  const std::int64_t begin = clock_.now_ms();
  const std::int64_t end = begin + std::max<std::int64_t>(1, period_ms_);
  std::set<std::string> emitted;

  for (const auto& day : daysOverlapping(begin, period_ms_)) {
    for (auto& r : store_.loadResolutions(day)) {
      if (r.resolved_at_ms < begin || r.resolved_at_ms >= end) {
        continue;
      }
      if (wanted.count(r.market_id) == 0 || !emitted.insert(r.market_id).second) {
        continue;
      }
      out.push_back(std::move(r));
    }
  }

  for (const auto& m : store_.loadMarkets(time_utils::dayKey(begin))) {
    if (!m.resolved || !m.outcome || wanted.count(m.market_id) == 0 ||
        !emitted.insert(m.market_id).second) {
      continue;
    }
    out.push_back(domain::Resolution{m.market_id, *m.outcome, begin});
  }
  return out;
}

// --- RecordedSignalExtractor -------------------------------------------------

RecordedSignalExtractor::RecordedSignalExtractor(const SnapshotStore& store,
                                                 const ITimeProvider& clock)
    : store_(&store), clock_(&clock) {}

RecordedSignalExtractor::RecordedSignalExtractor(
    std::vector<domain::RawSignal> recorded)
    : fixed_(std::move(recorded)) {}

const std::vector<domain::RawSignal>& RecordedSignalExtractor::answersFor(
    const std::string& day_key) {
  if (store_ == nullptr) {
    return fixed_;
  }
  if (day_key != cached_day_) {
    cached_ = store_->loadSignals(day_key);
    cached_day_ = day_key;
  }
  return cached_;
}

std::vector<domain::RawSignal> RecordedSignalExtractor::extract(
    const domain::Article& article,
    const std::vector<domain::MarketQuote>& candidates) {
  std::set<std::string> ids;
  for (const auto& c : candidates) {
    ids.insert(c.market_id);
  }
  const std::string day =
      clock_ != nullptr ? time_utils::dayKey(clock_->now_ms()) : std::string();

  std::vector<domain::RawSignal> out;
  for (const auto& s : answersFor(day)) {
    if (s.headline == article.headline && ids.count(s.market_id) != 0) {
      out.push_back(s);
    }
  }
  return out;
}

}  // namespace predict
