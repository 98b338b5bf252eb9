#pragma once

#include "predict/domain/bet.hpp"
#include "predict/domain/equity_sample.hpp"
#include "predict/domain/market.hpp"
#include "predict/domain/position.hpp"
#include "predict/domain/resolution.hpp"
#include "predict/domain/signal.hpp"
#include "predict/io/persistence_sink.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <optional>

// -----------------------------------------------------------------------------
// JSON codec for domain records
// -----------------------------------------------------------------------------
//
// @brief  nlohmann_json ADL hooks (to_json / from_json) for every record the
//         engine persists or exchanges, plus lenient parsers for market and
//         resolution payloads coming from the venue.
//
// @details
// Timestamps are written twice: "<name>_ms" (epoch ms, authoritative on
// read) and "<name>" (ISO-8601 UTC, for humans and other tools). Readers
// accept either, preferring the _ms field.
//
// Directions are "YES" / "NO"; modes are "backtest" / "paper" / "live".
//
// from_json throws nlohmann::json exceptions for missing or mistyped
// required fields and InvalidSignalError for semantically invalid values
// (unknown direction, unparseable timestamp).
// -----------------------------------------------------------------------------

namespace predict {
namespace domain {

void to_json(nlohmann::json& j, const Article& a);
void from_json(const nlohmann::json& j, Article& a);

void to_json(nlohmann::json& j, const MarketQuote& q);
void from_json(const nlohmann::json& j, MarketQuote& q);

void to_json(nlohmann::json& j, const RawSignal& s);
void from_json(const nlohmann::json& j, RawSignal& s);

void to_json(nlohmann::json& j, const Signal& s);
void from_json(const nlohmann::json& j, Signal& s);

void to_json(nlohmann::json& j, const Bet& b);
void from_json(const nlohmann::json& j, Bet& b);

void to_json(nlohmann::json& j, const Position& p);

void to_json(nlohmann::json& j, const Resolution& r);
void from_json(const nlohmann::json& j, Resolution& r);

void to_json(nlohmann::json& j, const Settlement& s);

void to_json(nlohmann::json& j, const EquitySample& e);
void from_json(const nlohmann::json& j, EquitySample& e);

}  // namespace domain

void to_json(nlohmann::json& j, const SignalRecord& r);
void from_json(const nlohmann::json& j, SignalRecord& r);

namespace codec {

// -------------------------------------------------------------------------
// parseMarket(j, observed_at_ms)
// -------------------------------------------------------------------------
// @brief  Reads a market object in any of the shapes seen in practice:
//
//   {"market_id": "m1", "yes_price": 0.6, "no_price": 0.4, ...}
//   {"id": 123, "outcomes": ["Yes","No"], "outcomePrices": ["0.6","0.4"]}
//   {"id": "123", "outcomes": "[\"Yes\",\"No\"]",
//    "outcome_prices": "[\"0.6\",\"0.4\"]"}
//
// Volume from volume_24h / volume24hr / volume24hrClob / volume; numbers
// may be JSON strings. Outcome from outcome / winningOutcome /
// resolvedOutcome / result / resolution (string, {"name": ...} object or
// one-element list). updated_at_ms / updated_at override observed_at_ms.
//
// @return std::nullopt when the id or either price is missing.
// -------------------------------------------------------------------------
std::optional<domain::MarketQuote> parseMarket(const nlohmann::json& j,
                                               std::int64_t observed_at_ms);

// Outcome value in any of the shapes above -> Direction.
std::optional<domain::Direction> parseOutcome(const nlohmann::json& value);

// -------------------------------------------------------------------------
// parseResolution(j, default_resolved_at_ms)
// -------------------------------------------------------------------------
// @return std::nullopt when market_id or a YES/NO outcome is missing.
// -------------------------------------------------------------------------
std::optional<domain::Resolution> parseResolution(
    const nlohmann::json& j, std::int64_t default_resolved_at_ms);

// Reads "<key>_ms" (integer) or "<key>" (ISO string or integer ms).
std::optional<std::int64_t> readTimestamp(const nlohmann::json& j,
                                          const char* key);

}  // namespace codec
}  // namespace predict
