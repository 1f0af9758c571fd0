#pragma once

#include "nanotrade/concurrent/thread_safe_queue.hpp"
#include "nanotrade/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace nanotrade {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ control and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Serves operator commands on a REP socket and broadcasts detection
//         telemetry on a PUB socket, both from one worker thread.
//
// @details
//   REP (default port 5556)
//     Each request is a plain command string (PING, STATUS, PRESET <name>).
//     It is handed to the command handler, bound to
//     DetectionEngine::executeCommand(), and the JSON reply is sent back.
//
//   PUB (default port 5557)
//     BreakerTransitionEvent and CascadeEvent are published as one JSON
//     object each:
//
//       {"type":"breaker_transition","tick":812,"from":"Normal",
//        "to":"Pause","countdown":119}
//       {"type":"cascade","tick":812,"pattern":"VOL_CRASH",
//        "confidence":60,"duration":240}
//
//     Events reach the worker through a ThreadSafeQueue filled from the tick
//     loop, so formatting and socket I/O stay off the tick path. Per-tick
//     reports are not published.
//
// Thread model:
//   start() and stop() from the owning thread. pushTelemetry() from any
//   thread. The command handler runs on the IPC worker.
//
// Ownership:
//   Owned by DetectionEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Binds both sockets and spawns the worker. A no-op when already
  //         running.
  //
  // @throws zmq::error_t if either endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Clears the running flag, joins the worker and closes the sockets.
  // Idempotent.
  void stop();

  // Enqueues an event for the PUB socket. Safe from any thread.
  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Renders a telemetry event as its JSON wire form.
  //
  // @return The JSON string for BreakerTransitionEvent and CascadeEvent,
  //         std::nullopt for every other alternative.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  // Worker loop: drain telemetry, then wait up to kPollTimeoutMs for one
  // command. Drains once more on exit.
  void run();

  void processTelemetry();
  void processCommands();

  static std::string formatBreakerTransition(const BreakerTransitionEvent& e);
  static std::string formatCascade(const CascadeEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace nanotrade
