#pragma once

#include "nanotrade/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace nanotrade {

// -----------------------------------------------------------------------------
// MarketDataGateway - ZeroMQ SUB bridge for the tick feed
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON market-data messages on a ZeroMQ SUB socket and
//         turns each into a MarketTickEvent for the tick loop.
//
// @details
// A feeder (live adapter or recorded-stimulus replayer) publishes one JSON
// message per tick; see gateway/market_message.hpp for the format. Each
// message that parses becomes exactly one tick, stamped with a gateway
// sequence number in arrival order.
//
// A message that fails to parse is logged to stderr and skipped. It does
// not consume a tick and does not stop the loop.
//
// Thread model:
//   run() blocks the calling thread (the market-data thread). stop() may be
//   called from any thread; the loop notices within kRecvTimeoutMs because
//   the socket has ZMQ_RCVTIMEO set.
//
// Ownership:
//   Owns the zmq::context_t and SUB socket. Holds a copy of the event sink,
//   normally bound to DetectionEngine::pushEvent().
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Creates the SUB socket, subscribes to everything and connects.
  //
  // @param  event_sink  Receives one MarketTickEvent per parsed message.
  // @param  endpoint    Publisher endpoint to connect to.
  //
  // @throws zmq::error_t if the endpoint is invalid.
  // -------------------------------------------------------------------------
  explicit MarketDataGateway(EventSink event_sink,
                             const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  // Blocking receive loop. Call from exactly one thread.
  void run();

  void stop();

  std::uint64_t received() const { return sequence_.load(); }
  std::uint64_t rejected() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sequence_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace nanotrade
