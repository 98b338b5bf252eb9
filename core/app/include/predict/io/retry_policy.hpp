#pragma once

#include "predict/domain/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

namespace predict {

// -----------------------------------------------------------------------------
// RetryPolicy — bounded exponential backoff for external calls
// -----------------------------------------------------------------------------
//
// @brief  How AgentLoop wraps every fetch: at most max_attempts tries, each
//         given `timeout`, sleeping backoffFor(n) between tries.
//
// @details
//   backoffFor(1) = initial_backoff
//   backoffFor(n) = min(initial_backoff * multiplier^(n-1), max_backoff)
//
// Only TransientIoError is retried. Other exceptions propagate on the first
// throw. After the last attempt the TransientIoError propagates and the
// tick soft-fails.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds initial_backoff{200};
  double multiplier{2.0};
  std::chrono::milliseconds max_backoff{5000};
  std::chrono::milliseconds timeout{10000};

  // Backoff before retry number `retry` (1-based).
  std::chrono::milliseconds backoffFor(int retry) const {
    double ms = static_cast<double>(initial_backoff.count());
    for (int i = 1; i < retry; ++i) {
      ms *= multiplier;
      if (ms >= static_cast<double>(max_backoff.count())) {
        break;
      }
    }
    const double capped =
        std::min(ms, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
  }
};

// Sleep hook so tests and backtests do not actually wait.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline void realSleep(std::chrono::milliseconds d) {
  std::this_thread::sleep_for(d);
}

// -------------------------------------------------------------------------
// retryCall(policy, what, sleeper, fn)
// -------------------------------------------------------------------------
// @brief  Invokes fn(policy.timeout) until it returns or the attempts run
//         out. `what` names the call in the log lines.
// -------------------------------------------------------------------------
template <typename Fn>
auto retryCall(const RetryPolicy& policy, const std::string& what,
               const Sleeper& sleeper, Fn&& fn)
    -> decltype(fn(policy.timeout)) {
  const int attempts = std::max(1, policy.max_attempts);
  for (int attempt = 1;; ++attempt) {
    try {
      return fn(policy.timeout);
    } catch (const TransientIoError& e) {
      if (attempt >= attempts) {
        std::cerr << "[RetryPolicy] " << what << " failed after " << attempt
                  << " attempts: " << e.what() << "\n";
        throw;
      }
      const auto wait = policy.backoffFor(attempt);
      std::cerr << "[RetryPolicy] WARNING: " << what << " attempt " << attempt
                << " failed (" << e.what() << "), retrying in "
                << wait.count() << "ms\n";
      if (sleeper) {
        sleeper(wait);
      }
    }
  }
}

}  // namespace predict
