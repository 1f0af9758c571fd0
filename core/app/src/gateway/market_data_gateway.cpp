#include "nanotrade/gateway/market_data_gateway.hpp"

#include "nanotrade/gateway/market_message.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace nanotrade {

MarketDataGateway::MarketDataGateway(EventSink event_sink,
                                     const std::string& endpoint)
    : event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): receive, parse, forward
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout, re-check running_
    }

    std::string payload = msg.to_string();

    try {
      MarketTickEvent tick;
      tick.input = parseMarketMessage(payload);
      tick.timestamp = std::chrono::system_clock::now();
      tick.sequence_id = sequence_.fetch_add(1) + 1;
      event_sink_(std::move(tick));
    } catch (const nlohmann::json::exception& e) {
      rejected_.fetch_add(1);
      std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
                << " payload: " << payload << "\n";
    } catch (const std::invalid_argument& e) {
      rejected_.fetch_add(1);
      std::cerr << "[MarketDataGateway] rejected message: " << e.what()
                << " payload: " << payload << "\n";
    }
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace nanotrade
