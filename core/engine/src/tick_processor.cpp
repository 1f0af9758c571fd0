#include "nanotrade/engine/tick_processor.hpp"

#include "nanotrade/book/order_book.hpp"
#include "nanotrade/detect/cascade_detector.hpp"

#include <chrono>
#include <iostream>

namespace nanotrade {

TickProcessor::TickProcessor(EventBus& bus, const domain::EngineConfig& config,
                             const ModelWeights& weights)
    : bus_(bus), pipeline_(config, weights) {
  status_.preset = config.initial_preset;
  status_.thresholds = pipeline_.state().thresholds.active;

  tick_sub_id_ = bus_.subscribe<MarketTickEvent>(
      [this](const MarketTickEvent& e) { onTick(e); });
}

TickProcessor::~TickProcessor() { bus_.unsubscribe(tick_sub_id_); }

EngineStatus TickProcessor::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

// -----------------------------------------------------------------------------
// onTick(): step, publish, refresh the status snapshot
// -----------------------------------------------------------------------------
void TickProcessor::onTick(const MarketTickEvent& event) {
  const domain::BreakerMode before = pipeline_.state().breaker.mode;

  const domain::OutputRecord out = pipeline_.step(event.input);
  const PipelineState& state = pipeline_.state();
  const std::uint64_t tick = pipeline_.ticks() - 1;
  const Timestamp now = std::chrono::system_clock::now();

  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.ticks = pipeline_.ticks();
    status_.preset = state.thresholds.preset;
    status_.thresholds = state.thresholds.active;
    status_.breaker_mode = state.breaker.mode;
    status_.breaker_countdown = state.breaker.countdown;
    status_.bids = bidCount(state.book);
    status_.asks = askCount(state.book);
    if (out.alert_active) ++status_.alerts;
    if (out.match_valid) ++status_.matches;
    if (out.ml_valid) ++status_.classifications;
    if (out.cascade_valid) ++status_.cascades;
    status_.last_output = out;
  }

  TickReportEvent report;
  report.tick = tick;
  report.input = event.input;
  report.output = out;
  report.timestamp = now;
  bus_.publish(report);

  if (out.cascade_valid) {
    const CascadeOutput& cascade = pipeline_.lastCascade();
    CascadeEvent ce;
    ce.tick = tick;
    ce.pattern = cascade.pattern;
    ce.confidence = cascade.trigger.confidence;
    ce.duration = cascade.trigger.duration;
    ce.timestamp = now;

    std::cout << "[TickProcessor] tick=" << tick
              << " cascade=" << cascadePatternName(ce.pattern)
              << " confidence=" << static_cast<int>(ce.confidence)
              << " duration=" << ce.duration << "\n";
    bus_.publish(ce);
  }

  if (out.cb_mode != before) {
    BreakerTransitionEvent bt;
    bt.tick = tick;
    bt.from = before;
    bt.to = out.cb_mode;
    bt.countdown = state.breaker.countdown;
    bt.timestamp = now;

    std::cout << "[TickProcessor] tick=" << tick << " breaker "
              << domain::breakerModeName(bt.from) << " -> "
              << domain::breakerModeName(bt.to)
              << " countdown=" << bt.countdown << "\n";
    bus_.publish(bt);
  }
}

}  // namespace nanotrade
