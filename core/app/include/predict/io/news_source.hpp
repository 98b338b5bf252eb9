#pragma once

#include "predict/domain/market.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace predict {

// -----------------------------------------------------------------------------
// INewsSource
// -----------------------------------------------------------------------------
//
// fetchSince(watermark_ms, timeout)
//   Articles published strictly after watermark_ms, each returned at most
//   once per source instance. AgentLoop advances the watermark to the
//   newest published_at_ms it has seen, so a re-fetch never reprocesses an
//   article.
//
//   Throws TransientIoError for retryable failures (unreachable feed,
//   timeout, unreadable file). Anything else is a bug or fatal.
// -----------------------------------------------------------------------------
class INewsSource {
 public:
  virtual ~INewsSource() = default;

  virtual std::vector<domain::Article> fetchSince(
      std::int64_t watermark_ms, std::chrono::milliseconds timeout) = 0;
};

}  // namespace predict
