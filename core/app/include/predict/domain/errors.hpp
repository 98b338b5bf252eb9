#pragma once

#include <stdexcept>
#include <string>

namespace predict {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Every exception the engine throws derives from predict::Error, so
//         the AgentLoop tick boundary can catch one base type.
//
// @details
//   InvalidSignalError      malformed upstream input. Rejected, no retry.
//   TransientIoError        fetch/timeout failure. RetryPolicy retries with
//                           backoff, then the tick soft-fails.
//   ExecutionError          the execution engine refused a Bet. The signal
//                           is rejected, the tick continues.
//   FatalError              configuration or persistence is unusable. At
//                           startup the loop does not start; mid-tick the
//                           tick aborts before committing anything further.
//
// Risk rejections and resolution state conflicts are not exceptions. They
// are ordinary results (RiskDecision, ResolveStatus).
// -----------------------------------------------------------------------------
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidSignalError : public Error {
 public:
  using Error::Error;
};

class TransientIoError : public Error {
 public:
  using Error::Error;
};

class ExecutionError : public Error {
 public:
  using Error::Error;
};

// Stake exceeds the cash bankroll.
class InsufficientBankrollError : public ExecutionError {
 public:
  using ExecutionError::ExecutionError;
};

// Bet direction differs from the open Position in the same market.
class PositionConflictError : public ExecutionError {
 public:
  using ExecutionError::ExecutionError;
};

// Bet into a market that has already resolved.
class MarketResolvedError : public ExecutionError {
 public:
  using ExecutionError::ExecutionError;
};

// Non-positive stake, execution price outside (0, 1), empty market id.
class InvalidBetError : public ExecutionError {
 public:
  using ExecutionError::ExecutionError;
};

class FatalError : public Error {
 public:
  using Error::Error;
};

class ConfigError : public FatalError {
 public:
  using FatalError::FatalError;
};

class PersistenceError : public FatalError {
 public:
  using FatalError::FatalError;
};

}  // namespace predict
