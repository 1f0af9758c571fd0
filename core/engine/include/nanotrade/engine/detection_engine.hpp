#pragma once

#include "nanotrade/concurrent/event_loop_thread.hpp"
#include "nanotrade/domain/engine_config.hpp"
#include "nanotrade/domain/market_event.hpp"
#include "nanotrade/engine/tick_processor.hpp"
#include "nanotrade/eventbus/event_bus.hpp"
#include "nanotrade/events/event.hpp"
#include "nanotrade/ml/model_weights.hpp"
#include "nanotrade/network/ipc_server.hpp"
#include "nanotrade/network/market_data_thread.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nanotrade {

// -----------------------------------------------------------------------------
// DetectionEngine — top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns the tick loop, the tick processor and the optional network
//         transports, and wires them together.
//
// @details
// Thread layout once started:
//
//   tick loop thread      EventLoopThread + TickProcessor. Every tick, from
//                         whatever source, is stepped here one at a time.
//   market data thread    MarketDataGateway (ZMQ SUB). Pushes parsed ticks
//                         into the tick loop's queue.
//   ipc thread            IpcServer (ZMQ REP + PUB). Serves executeCommand()
//                         and publishes breaker/cascade telemetry bridged
//                         from the tick loop's bus.
//
// An empty endpoint in the EngineConfig leaves that transport unstarted.
// Unit tests clear all three and drive the engine through pushInput().
//
// Startup order: processor, tick loop, IPC server, market data last so no
// tick arrives before its consumer exists. Shutdown stops market data, joins
// the tick loop, then detaches the telemetry bridges and joins the IPC
// server; no telemetry is published once the bridges are gone.
//
// Thread model:
//   Constructed, started, stopped and destroyed on the main thread.
//   pushInput(), pushEvent() and status() are safe from any thread.
//   executeCommand() runs on the IPC thread (or the caller's, in tests).
//
// Ownership:
//   Owns the model weights by value; the pipeline holds a reference into
//   them, so they are declared before the processor.
// -----------------------------------------------------------------------------
class DetectionEngine {
 public:
  explicit DetectionEngine(domain::EngineConfig config,
                           ModelWeights weights = ModelWeights{});

  // RAII: stop() if still running.
  ~DetectionEngine();

  DetectionEngine(const DetectionEngine&) = delete;
  DetectionEngine& operator=(const DetectionEngine&) = delete;
  DetectionEngine(DetectionEngine&&) = delete;
  DetectionEngine& operator=(DetectionEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Creates the processor, starts the tick loop and brings up every
  //         configured transport. A no-op when already running.
  //
  // @throws zmq::error_t if a configured endpoint cannot be bound or
  //         connected. The engine is left stopped in that case.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Stops market data, then IPC, then the tick loop, then destroys
  //         the processor. Ticks still queued are discarded. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Queues one input record as a tick.
  void pushInput(const domain::InputRecord& input);

  // Queues any event on the tick loop. Bound as the gateway's event sink.
  void pushEvent(Event event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Handles one operator command and returns a JSON reply.
  //
  // @details
  //   PING            {"status":"ok","response":"PONG"}
  //   STATUS          {"status":"ok", ...counters, breaker, book...}
  //   PRESET <name>   queues a Config tick selecting the named preset;
  //                   it takes effect like any Config tick on the feed.
  //   anything else   {"status":"error","response":"Unknown command: ..."}
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Latest counters, or a zeroed status before start().
  EngineStatus status() const;

  // The tick loop's bus. TickReportEvent, CascadeEvent and
  // BreakerTransitionEvent are published here; subscribe before start() to
  // see the first tick.
  EventBus& eventBus();

  bool running() const { return running_.load(); }

 private:
  domain::EngineConfig config_;
  ModelWeights weights_;

  EventLoopThread tick_loop_;

  std::unique_ptr<TickProcessor> tick_processor_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  std::vector<EventBus::SubscriptionId> telemetry_sub_ids_;
  std::atomic<std::uint64_t> next_sequence_{0};
  std::atomic<bool> running_{false};
};

}  // namespace nanotrade
