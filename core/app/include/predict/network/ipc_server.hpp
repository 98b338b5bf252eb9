#pragma once

#include "predict/concurrent/thread_safe_queue.hpp"
#include "predict/eventbus/event_bus.hpp"
#include "predict/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace predict {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ operator interface: commands in, telemetry out
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that publishes engine telemetry as JSON
//         on a PUB socket and answers operator commands on a REP socket.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (default tcp://127.0.0.1:5557):
//      Broadcasts one JSON object per Event: bet_placed, position_update,
//      resolution, signal_evaluated, risk_reject, risk_violation, tick.
//      Events arrive through a ThreadSafeQueue fed from EventBus
//      subscribers on the tick thread, so JSON formatting and ZMQ I/O
//      never run inside a tick.
//
//   2. REP socket (default tcp://127.0.0.1:5556):
//      Accepts command strings (PING, STATUS, TICK, HALT <reason>, RESUME)
//      and forwards each to command_handler_, normally bound to
//      AgentLoop::executeCommand(). The JSON reply is sent back.
//      ZMQ_RCVTIMEO keeps recv() from blocking so the thread alternates
//      between commands and telemetry.
//
// Thread model:
//   Constructed and destroyed on the main thread. start() spawns the
//   worker; stop() detaches from the EventBus, then sets an atomic flag
//   and joins it. A TICK command publishing on the worker during stop()
//   still finds the server alive. pushTelemetry() may
//   be called from any thread. command_handler_ runs on the IPC thread,
//   so whatever it touches must be thread-safe (AgentLoop status is
//   mutex-guarded, halting is atomic).
//
// Ownership:
//   Owns the ZMQ context, both sockets, the telemetry queue and the
//   worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  command_handler  Takes a command string, returns a JSON reply.
  // @param  cmd_endpoint     ZMQ endpoint for the REP command socket.
  // @param  pub_endpoint     ZMQ endpoint for the PUB telemetry socket.
  //
  // No sockets are opened and no threads are spawned until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when already running.
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  // Enqueues an event for the PUB socket. Safe from any thread.
  void pushTelemetry(Event event);

  // Forwards every event published on bus to pushTelemetry() until stop()
  // or destruction. Replaces an earlier attachment.
  void attachTelemetry(EventBus& bus);
  void detachTelemetry();

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @brief  Converts an Event into the JSON line published on the PUB
  //         socket. Every object carries "type" and "timestamp".
  //
  // @return std::nullopt only if the variant holds a type with no
  //         telemetry representation.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatSignalEvaluated(const SignalEvaluatedEvent& e);
  static std::string formatBetPlaced(const BetPlacedEvent& e);
  static std::string formatPositionUpdate(const PositionUpdateEvent& e);
  static std::string formatResolution(const ResolutionEvent& e);
  static std::string formatRiskReject(const RiskRejectEvent& e);
  static std::string formatRiskViolation(const RiskViolationEvent& e);
  static std::string formatTick(const TickEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  EventBus* telemetry_bus_{nullptr};
  EventBus::SubscriptionId telemetry_subscription_{0};
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace predict
