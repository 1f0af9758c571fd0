#include "nanotrade/engine/detection_engine.hpp"

#include "nanotrade/codec/input_codec.hpp"
#include "nanotrade/domain/alert.hpp"
#include "nanotrade/domain/thresholds.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>

namespace nanotrade {

DetectionEngine::DetectionEngine(domain::EngineConfig config,
                                 ModelWeights weights)
    : config_(std::move(config)), weights_(std::move(weights)) {}

DetectionEngine::~DetectionEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void DetectionEngine::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Processor first, so the first tick has a consumer -------------
  tick_processor_ = std::make_unique<TickProcessor>(tick_loop_.eventBus(),
                                                    config_, weights_);
  tick_loop_.start();
  running_.store(true);

  try {
    // ---  2) IpcServer and its telemetry bridges ---------------------------
    if (!config_.ipc_cmd_endpoint.empty() &&
        !config_.ipc_pub_endpoint.empty()) {
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
      ipc_server_->start();

      telemetry_sub_ids_.push_back(
          tick_loop_.eventBus().subscribe<BreakerTransitionEvent>(
              [this](const BreakerTransitionEvent& e) {
                ipc_server_->pushTelemetry(e);
              }));
      telemetry_sub_ids_.push_back(
          tick_loop_.eventBus().subscribe<CascadeEvent>(
              [this](const CascadeEvent& e) { ipc_server_->pushTelemetry(e); }));
    }

    // ---  3) MarketDataThread last: ticks begin flowing ---------------------
    if (!config_.market_data_endpoint.empty()) {
      market_data_thread_ = std::make_unique<MarketDataThread>(
          [this](Event event) { pushEvent(std::move(event)); },
          config_.market_data_endpoint);
      market_data_thread_->start();
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[DetectionEngine] transport startup failed: " << e.what()
              << "\n";
    stop();
    throw;
  }

  std::cout << "[DetectionEngine] started. preset="
            << domain::presetName(config_.initial_preset)
            << " adaptive=" << (config_.adaptive_thresholds ? "on" : "off")
            << " threads: tick" << (ipc_server_ ? ", ipc" : "")
            << (market_data_thread_ ? ", market_data" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void DetectionEngine::stop() {
  if (!running_.load()) {
    return;
  }

  // ---  1) Stop inflow -------------------------------------------------------
  market_data_thread_.reset();

  // ---  2) Join the tick loop; nothing publishes after this ----------------
  tick_loop_.stop();

  // ---  3) Detach telemetry bridges, then join the IPC thread ---------------
  for (auto id : telemetry_sub_ids_) {
    tick_loop_.eventBus().unsubscribe(id);
  }
  telemetry_sub_ids_.clear();
  ipc_server_.reset();

  // ---  4) Drop the processor ------------------------------------------------
  tick_processor_.reset();

  running_.store(false);

  std::cout << "[DetectionEngine] stopped. All threads joined.\n";
}

void DetectionEngine::pushInput(const domain::InputRecord& input) {
  MarketTickEvent tick;
  tick.input = input;
  tick.timestamp = std::chrono::system_clock::now();
  tick.sequence_id = next_sequence_.fetch_add(1) + 1;
  tick_loop_.push(std::move(tick));
}

void DetectionEngine::pushEvent(Event event) {
  tick_loop_.push(std::move(event));
}

EngineStatus DetectionEngine::status() const {
  if (!tick_processor_) {
    return EngineStatus{};
  }
  return tick_processor_->status();
}

EventBus& DetectionEngine::eventBus() { return tick_loop_.eventBus(); }

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string DetectionEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  std::istringstream words(cmd);
  std::string verb;
  std::string arg;
  words >> verb >> arg;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    const EngineStatus s = status();
    response["status"] = "ok";
    response["running"] = running();
    response["ticks"] = s.ticks;
    response["preset"] = domain::presetName(s.preset);
    response["thresholds"] = {{"spike", s.thresholds.spike},
                              {"flash", s.thresholds.flash},
                              {"volume_floor", s.thresholds.volume_floor}};
    response["breaker"] = {{"mode", domain::breakerModeName(s.breaker_mode)},
                           {"countdown", s.breaker_countdown}};
    response["book"] = {{"bids", s.bids}, {"asks", s.asks}};
    response["alerts"] = s.alerts;
    response["matches"] = s.matches;
    response["classifications"] = s.classifications;
    response["cascades"] = s.cascades;
    response["ml"] = {
        {"class", domain::anomalyClassName(
                      static_cast<domain::AnomalyClass>(s.last_output.ml_class))},
        {"confidence", s.last_output.ml_confidence}};
  } else if (verb == "PRESET" && !arg.empty()) {
    const auto preset = domain::presetFromName(arg);
    if (preset) {
      pushInput(decodeWord(encodeConfig(*preset)));
      response["status"] = "ok";
      response["response"] =
          std::string("Preset ") + domain::presetName(*preset) + " queued";
    } else {
      response["status"] = "error";
      response["response"] = "Unknown preset: " + arg;
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace nanotrade
