#pragma once

#include "nanotrade/events/event.hpp"
#include "nanotrade/gateway/market_data_gateway.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace nanotrade {

// -----------------------------------------------------------------------------
// MarketDataThread — dedicated I/O thread for the tick feed
// -----------------------------------------------------------------------------
//
// @brief  Runs MarketDataGateway::run() on its own std::thread so ZeroMQ
//         receives never block the tick loop.
//
// @details
// The gateway owns a blocking recv loop with ZMQ_RCVTIMEO rather than a
// queue, so it gets a raw std::thread instead of an EventLoopThread. Parsed
// ticks leave through the event sink, which DetectionEngine binds to its
// tick loop's queue.
//
// Thread model:
//   start() and stop() are called from the owning thread (main, via
//   DetectionEngine). The internal thread runs the gateway exclusively.
//
// Ownership:
//   Owned by DetectionEngine via std::unique_ptr. Owns the gateway, which
//   is created in start() so no socket exists before the engine is ready.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  // No sockets opened and no threads spawned here.
  MarketDataThread(EventSink event_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  //
  // @brief  Creates the gateway (connects the SUB socket) and spawns the
  //         receive thread. A no-op when already running.
  //
  // @throws zmq::error_t if the endpoint cannot be connected.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  //
  // @brief  Signals the gateway and joins the thread. Returns within one
  //         receive timeout (100 ms). Idempotent.
  // -------------------------------------------------------------------------
  void stop();

 private:
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace nanotrade
