#include "predict/network/ipc_server.hpp"

#include "predict/storage/json_codec.hpp"
#include "predict/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace predict {

namespace {

nlohmann::json header(const char* type, std::int64_t timestamp_ms) {
  nlohmann::json j;
  j["type"] = type;
  j["timestamp_ms"] = timestamp_ms;
  j["timestamp"] = time_utils::isoTimestamp(timestamp_ms);
  return j;
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  detachTelemetry();
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::attachTelemetry(EventBus& bus) {
  detachTelemetry();
  telemetry_bus_ = &bus;
  telemetry_subscription_ =
      bus.subscribe([this](const Event& e) { pushTelemetry(e); });
}

void IpcServer::detachTelemetry() {
  if (telemetry_bus_ == nullptr) {
    return;
  }
  telemetry_bus_->unsubscribe(telemetry_subscription_);
  telemetry_bus_ = nullptr;
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  // Publish whatever is still queued before the sockets close.
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
// A REP socket must answer every request before it can receive the next
// one, so a handler exception is turned into an error reply.
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] WARNING: command '" << cmd
              << "' failed: " << e.what() << "\n";
    nlohmann::json err;
    err["status"] = "error";
    err["message"] = e.what();
    response = err.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to per-type formatters
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<BetPlacedEvent>(&event)) {
    return formatBetPlaced(*e);
  }
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<ResolutionEvent>(&event)) {
    return formatResolution(*e);
  }
  if (auto* e = std::get_if<SignalEvaluatedEvent>(&event)) {
    return formatSignalEvaluated(*e);
  }
  if (auto* e = std::get_if<RiskRejectEvent>(&event)) {
    return formatRiskReject(*e);
  }
  if (auto* e = std::get_if<RiskViolationEvent>(&event)) {
    return formatRiskViolation(*e);
  }
  if (auto* e = std::get_if<TickEvent>(&event)) {
    return formatTick(*e);
  }
  return std::nullopt;
}

std::string IpcServer::formatSignalEvaluated(const SignalEvaluatedEvent& e) {
  auto j = header("signal_evaluated", e.timestamp_ms);
  j["market_id"] = e.signal.market_id;
  j["direction"] = domain::toString(e.signal.direction);
  j["edge"] = e.signal.edge;
  j["confidence"] = e.signal.confidence;
  j["accepted"] = e.accepted;
  j["reason"] = e.reason;
  j["stake"] = e.stake;
  return j.dump();
}

std::string IpcServer::formatBetPlaced(const BetPlacedEvent& e) {
  auto j = header("bet_placed", e.timestamp_ms);
  j["bet_id"] = e.bet.id;
  j["market_id"] = e.bet.marketId();
  j["direction"] = domain::toString(e.bet.direction());
  j["stake"] = e.bet.stake_amount;
  j["execution_price"] = e.bet.execution_price;
  j["shares"] = e.bet.shares();
  j["edge"] = e.bet.signal.edge;
  j["mode"] = domain::toString(e.bet.mode);
  j["bankroll_after"] = e.bankroll_after;
  return j.dump();
}

std::string IpcServer::formatPositionUpdate(const PositionUpdateEvent& e) {
  auto j = header("position_update", e.timestamp_ms);
  j["position"] = e.position;
  return j.dump();
}

std::string IpcServer::formatResolution(const ResolutionEvent& e) {
  auto j = header("resolution", e.timestamp_ms);
  j["market_id"] = e.resolution.market_id;
  j["outcome"] = domain::toString(e.resolution.outcome);
  j["status"] = domain::toString(e.result.status);
  j["payout"] = e.result.payout;
  j["realized_pnl"] = e.result.realized_pnl;
  j["settled_bets"] = e.result.settled_bets;
  j["bankroll_after"] = e.bankroll_after;
  return j.dump();
}

std::string IpcServer::formatRiskReject(const RiskRejectEvent& e) {
  auto j = header("risk_reject", e.timestamp_ms);
  j["market_id"] = e.market_id;
  j["reason"] = e.reason;
  j["detail"] = e.detail;
  return j.dump();
}

std::string IpcServer::formatRiskViolation(const RiskViolationEvent& e) {
  auto j = header("risk_violation", e.timestamp_ms);
  j["reason"] = e.reason;
  j["current_value"] = e.current_value;
  j["limit_value"] = e.limit_value;
  return j.dump();
}

std::string IpcServer::formatTick(const TickEvent& e) {
  auto j = header("tick", e.timestamp_ms);
  j["tick"] = e.tick_number;
  j["ok"] = e.ok;
  if (!e.error.empty()) {
    j["error"] = e.error;
  }
  j["bets_placed"] = e.bets_placed;
  j["resolutions_applied"] = e.resolutions_applied;
  j["bankroll"] = e.bankroll;
  j["equity"] = e.equity;
  return j.dump();
}

}  // namespace predict
