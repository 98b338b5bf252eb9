#include "predict/storage/json_codec.hpp"

#include "predict/domain/errors.hpp"
#include "predict/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace predict {

using nlohmann::json;

namespace {

domain::Direction requireDirection(const json& j, const char* key) {
  const auto text = j.at(key).get<std::string>();
  const auto d = domain::parseDirection(text);
  if (!d) {
    throw InvalidSignalError(std::string("invalid ") + key + " '" + text + "'");
  }
  return *d;
}

std::int64_t requireTimestamp(const json& j, const char* key) {
  const auto ts = codec::readTimestamp(j, key);
  if (!ts) {
    throw InvalidSignalError(std::string("missing or invalid ") + key);
  }
  return *ts;
}

// Number, or a string holding one.
std::optional<double> looseNumber(const json& v) {
  if (v.is_number()) {
    return v.get<double>();
  }
  if (v.is_string()) {
    const auto& s = v.get_ref<const std::string&>();
    try {
      std::size_t used = 0;
      const double d = std::stod(s, &used);
      if (used == s.size()) {
        return d;
      }
    } catch (const std::logic_error&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<double> firstNumber(const json& j,
                                  std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
      continue;
    }
    if (auto v = looseNumber(*it)) {
      return v;
    }
  }
  return std::nullopt;
}

// A JSON array, or a string holding one.
std::optional<json> looseArray(const json& v) {
  if (v.is_array()) {
    return v;
  }
  if (v.is_string()) {
    json parsed = json::parse(v.get_ref<const std::string&>(), nullptr, false);
    if (parsed.is_array()) {
      return parsed;
    }
  }
  return std::nullopt;
}

const json* firstPresent(const json& j, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
      return &*it;
    }
  }
  return nullptr;
}

std::optional<std::string> idString(const json& j) {
  const json* v = firstPresent(j, {"market_id", "id"});
  if (v == nullptr) {
    return std::nullopt;
  }
  if (v->is_string()) {
    return v->get<std::string>();
  }
  if (v->is_number_integer()) {
    return std::to_string(v->get<std::int64_t>());
  }
  return std::nullopt;
}

}  // namespace

namespace codec {

std::optional<std::int64_t> readTimestamp(const json& j, const char* key) {
  auto ms = j.find(std::string(key) + "_ms");
  if (ms != j.end() && ms->is_number_integer()) {
    return ms->get<std::int64_t>();
  }
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  if (it->is_string()) {
    return time_utils::parseIsoTimestamp(it->get_ref<const std::string&>());
  }
  return std::nullopt;
}

std::optional<domain::Direction> parseOutcome(const json& value) {
  if (value.is_string()) {
    return domain::parseDirection(value.get_ref<const std::string&>());
  }
  if (value.is_object()) {
    for (const char* key : {"name", "label", "outcome"}) {
      auto it = value.find(key);
      if (it != value.end()) {
        return parseOutcome(*it);
      }
    }
    return std::nullopt;
  }
  if (value.is_array() && value.size() == 1) {
    return parseOutcome(value.front());
  }
  return std::nullopt;
}

std::optional<domain::MarketQuote> parseMarket(const json& j,
                                               std::int64_t observed_at_ms) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  auto id = idString(j);
  if (!id || id->empty()) {
    return std::nullopt;
  }

  std::optional<double> yes = firstNumber(j, {"yes_price"});
  std::optional<double> no = firstNumber(j, {"no_price"});

  if (!yes || !no) {
    const json* outcomes = firstPresent(j, {"outcomes", "outcome_labels"});
    const json* prices =
        firstPresent(j, {"outcomePrices", "outcome_prices", "outcomePrice"});
    if (outcomes != nullptr && prices != nullptr) {
      auto labels = looseArray(*outcomes);
      auto values = looseArray(*prices);
      if (labels && values) {
        for (std::size_t i = 0; i < labels->size() && i < values->size(); ++i) {
          if (!(*labels)[i].is_string()) {
            continue;
          }
          auto side = domain::parseDirection((*labels)[i].get<std::string>());
          auto price = looseNumber((*values)[i]);
          if (!side || !price) {
            continue;
          }
          if (*side == domain::Direction::Yes) {
            yes = price;
          } else {
            no = price;
          }
        }
      }
    }
  }
  if (!yes || !no) {
    return std::nullopt;
  }

  domain::MarketQuote q;
  q.market_id = *id;
  if (auto it = j.find("question"); it != j.end() && it->is_string()) {
    q.question = it->get<std::string>();
  }
  q.yes_price = *yes;
  q.no_price = *no;
  q.volume_24h = firstNumber(j, {"volume_24h", "volume24hr", "volume24hrClob",
                                 "volume"})
                     .value_or(0.0);
  q.book_depth = firstNumber(j, {"book_depth", "liquidity"}).value_or(0.0);

  for (const char* key : {"outcome", "winningOutcome", "resolvedOutcome",
                          "result", "resolution"}) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
      continue;
    }
    if (auto o = parseOutcome(*it)) {
      q.outcome = o;
      break;
    }
  }
  auto resolved = j.find("resolved");
  if (resolved != j.end() && resolved->is_boolean()) {
    q.resolved = resolved->get<bool>() || q.outcome.has_value();
  } else {
    q.resolved = q.outcome.has_value();
  }
  q.updated_at_ms = readTimestamp(j, "updated_at").value_or(observed_at_ms);
  return q;
}

std::optional<domain::Resolution> parseResolution(
    const json& j, std::int64_t default_resolved_at_ms) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  auto id = idString(j);
  auto it = j.find("outcome");
  if (!id || id->empty() || it == j.end()) {
    return std::nullopt;
  }
  auto outcome = parseOutcome(*it);
  if (!outcome) {
    return std::nullopt;
  }
  domain::Resolution r;
  r.market_id = *id;
  r.outcome = *outcome;
  r.resolved_at_ms =
      readTimestamp(j, "resolved_at").value_or(default_resolved_at_ms);
  return r;
}

}  // namespace codec

namespace domain {

// --- Article ---------------------------------------------------------------
void to_json(json& j, const Article& a) {
  j = json{{"headline", a.headline},
           {"summary", a.summary},
           {"source", a.source},
           {"url", a.url},
           {"published_at", time_utils::isoTimestamp(a.published_at_ms)},
           {"category", a.category}};
}

void from_json(const json& j, Article& a) {
  a.headline = j.at("headline").get<std::string>();
  a.summary = j.value("summary", std::string());
  a.source = j.value("source", std::string());
  a.url = j.value("url", std::string());
  a.category = j.value("category", std::string());
  a.published_at_ms = requireTimestamp(j, "published_at");
}

// --- MarketQuote -----------------------------------------------------------
void to_json(json& j, const MarketQuote& q) {
  j = json{{"market_id", q.market_id},
           {"question", q.question},
           {"yes_price", q.yes_price},
           {"no_price", q.no_price},
           {"volume_24h", q.volume_24h},
           {"book_depth", q.book_depth},
           {"resolved", q.resolved},
           {"updated_at_ms", q.updated_at_ms}};
  if (q.outcome) {
    j["outcome"] = toString(*q.outcome);
  } else {
    j["outcome"] = nullptr;
  }
}

void from_json(const json& j, MarketQuote& q) {
  auto parsed = codec::parseMarket(j, 0);
  if (!parsed) {
    throw InvalidSignalError("market object without id or YES/NO prices");
  }
  q = *parsed;
}

// --- RawSignal -------------------------------------------------------------
void to_json(json& j, const RawSignal& s) {
  j = json{{"market_id", s.market_id},
           {"direction", toString(s.direction)},
           {"estimated_prob", s.estimated_prob},
           {"confidence", s.confidence},
           {"reasoning", s.reasoning},
           {"headline", s.headline},
           {"strategy", s.strategy}};
}

void from_json(const json& j, RawSignal& s) {
  auto id = idString(j);
  if (!id) {
    throw InvalidSignalError("signal without market_id");
  }
  s.market_id = *id;
  s.direction = requireDirection(j, "direction");
  s.estimated_prob = j.at("estimated_prob").get<double>();
  s.confidence = j.value("confidence", 0.0);
  s.reasoning = j.value("reasoning", std::string());
  s.headline = j.value("headline", std::string());
  s.strategy = j.value("strategy", std::string());
}

// --- Signal ----------------------------------------------------------------
void to_json(json& j, const Signal& s) {
  j = json{{"timestamp_ms", s.timestamp_ms},
           {"timestamp", time_utils::isoTimestamp(s.timestamp_ms)},
           {"market_id", s.market_id},
           {"question", s.question},
           {"direction", toString(s.direction)},
           {"quoted_price", s.quoted_price},
           {"effective_price", s.effective_price},
           {"estimated_prob", s.estimated_prob},
           {"edge", s.edge},
           {"confidence", s.confidence},
           {"reasoning", s.reasoning},
           {"headline", s.headline},
           {"strategy", s.strategy}};
}

void from_json(const json& j, Signal& s) {
  s.timestamp_ms = requireTimestamp(j, "timestamp");
  s.market_id = j.at("market_id").get<std::string>();
  s.question = j.value("question", std::string());
  s.direction = requireDirection(j, "direction");
  s.quoted_price = j.at("quoted_price").get<double>();
  s.effective_price = j.value("effective_price", s.quoted_price);
  s.estimated_prob = j.at("estimated_prob").get<double>();
  s.edge = j.at("edge").get<double>();
  s.confidence = j.value("confidence", 0.0);
  s.reasoning = j.value("reasoning", std::string());
  s.headline = j.value("headline", std::string());
  s.strategy = j.value("strategy", std::string());
}

// --- Bet -------------------------------------------------------------------
void to_json(json& j, const Bet& b) {
  j = json{{"bet_id", b.id},
           {"signal", b.signal},
           {"stake_amount", b.stake_amount},
           {"kelly_fraction_applied", b.kelly_fraction_applied},
           {"mode", toString(b.mode)},
           {"execution_price", b.execution_price},
           {"shares", b.shares()},
           {"placed_at_ms", b.placed_at_ms},
           {"placed_at", time_utils::isoTimestamp(b.placed_at_ms)}};
}

void from_json(const json& j, Bet& b) {
  b.id = j.at("bet_id").get<BetId>();
  b.signal = j.at("signal").get<Signal>();
  b.stake_amount = j.at("stake_amount").get<double>();
  b.kelly_fraction_applied = j.value("kelly_fraction_applied", 0.0);
  const auto mode_text = j.value("mode", std::string("paper"));
  const auto mode = parseTradingMode(mode_text);
  if (!mode) {
    throw InvalidSignalError("invalid mode '" + mode_text + "'");
  }
  b.mode = *mode;
  b.execution_price = j.at("execution_price").get<double>();
  b.placed_at_ms = requireTimestamp(j, "placed_at");
}

// --- Position / Settlement (write-only: telemetry and reports) -------------
void to_json(json& j, const Position& p) {
  j = json{{"market_id", p.market_id},
           {"direction", toString(p.direction)},
           {"shares", p.shares},
           {"avg_price", p.avg_price},
           {"cost_basis", p.cost_basis},
           {"status", toString(p.status)},
           {"opened_at_ms", p.opened_at_ms},
           {"bet_count", p.bet_count}};
}

void to_json(json& j, const Settlement& s) {
  j = json{{"bet_id", s.bet_id},
           {"market_id", s.market_id},
           {"direction", toString(s.direction)},
           {"stake", s.stake},
           {"shares", s.shares},
           {"outcome", toString(s.outcome)},
           {"won", s.won},
           {"pnl", s.pnl},
           {"edge_at_entry", s.edge_at_entry},
           {"resolved_at_ms", s.resolved_at_ms}};
}

// --- Resolution ------------------------------------------------------------
void to_json(json& j, const Resolution& r) {
  j = json{{"market_id", r.market_id},
           {"outcome", toString(r.outcome)},
           {"resolved_at_ms", r.resolved_at_ms},
           {"resolved_at", time_utils::isoTimestamp(r.resolved_at_ms)}};
}

void from_json(const json& j, Resolution& r) {
  r.market_id = j.at("market_id").get<std::string>();
  r.outcome = requireDirection(j, "outcome");
  r.resolved_at_ms = requireTimestamp(j, "resolved_at");
}

// --- EquitySample ----------------------------------------------------------
void to_json(json& j, const EquitySample& e) {
  j = json{{"date", e.day_key},
           {"timestamp_ms", e.timestamp_ms},
           {"bankroll", e.bankroll},
           {"equity", e.equity}};
}

void from_json(const json& j, EquitySample& e) {
  e.timestamp_ms = requireTimestamp(j, "timestamp");
  e.day_key = j.value("date", time_utils::dayKey(e.timestamp_ms));
  e.bankroll = j.at("bankroll").get<double>();
  e.equity = j.value("equity", e.bankroll);
}

}  // namespace domain

// --- SignalRecord ----------------------------------------------------------
void to_json(json& j, const SignalRecord& r) {
  j = json{{"signal", r.signal},
           {"accepted", r.accepted},
           {"stage", r.stage},
           {"reason", r.reason},
           {"detail", r.detail},
           {"stake", r.stake},
           {"bet_id", r.bet_id}};
}

void from_json(const json& j, SignalRecord& r) {
  r.signal = j.at("signal").get<domain::Signal>();
  r.accepted = j.value("accepted", false);
  r.stage = j.value("stage", std::string());
  r.reason = j.value("reason", std::string());
  r.detail = j.value("detail", std::string());
  r.stake = j.value("stake", 0.0);
  r.bet_id = j.value("bet_id", domain::BetId{0});
}

}  // namespace predict
