#include "nanotrade/engine/tick_pipeline.hpp"

#include "nanotrade/codec/input_codec.hpp"
#include "nanotrade/detect/rule_detector.hpp"

namespace nanotrade {

namespace {

PipelineState initialState(const domain::EngineConfig& config) {
  PipelineState state;
  state.thresholds = initialThresholdState(config);
  return state;
}

}  // namespace

TickPipeline::TickPipeline(const domain::EngineConfig& config,
                           const ModelWeights& weights)
    : config_(config), weights_(weights), state_(initialState(config)) {}

void TickPipeline::reset() {
  state_ = initialState(config_);
  ticks_ = 0;
  last_cascade_ = CascadeOutput{};
}

// -----------------------------------------------------------------------------
// step(): compute every next state from state_, then commit together
// -----------------------------------------------------------------------------
domain::OutputRecord TickPipeline::step(const domain::InputRecord& input) {
  const PipelineState& now = state_;
  const domain::MarketEvent event = decodeInput(input);

  // --- Order book, governed by the breaker state committed last tick ------
  const domain::PolicyDirectives policy = policyFor(now.breaker, config_);
  const OrderBookStep book = stepOrderBook(now.book, event, policy);

  // --- Statistics and rules -----------------------------------------------
  const domain::AlertRecord rules =
      evaluateRules(now.stats, event, now.thresholds.active);

  PipelineState next;
  next.book = book.next;
  next.stats = stepStatistics(now.stats, event, book.match.valid);
  next.thresholds = stepThresholds(now.thresholds, event, config_);

  // --- Feature snapshot and classifier ------------------------------------
  next.features = stepFeatures(now.features, now.stats, now.book);
  next.ml = stepMlPipeline(now.ml, now.features, weights_);
  const MlResult& ml = next.ml.result;

  // --- Fusion, cascade, breaker -------------------------------------------
  next.fusion = stepAlertFusion(now.fusion, ml);
  const domain::AlertRecord fused = fuseAlerts(rules, next.fusion);

  const CascadeStep cascade = stepCascade(now.cascade, ruleClass(rules), ml,
                                          config_.rule_trigger_confidence);
  next.cascade = cascade.next;

  next.breaker = stepCircuitBreaker(
      now.breaker, selectTrigger(cascade.output, rules, ml, config_));

  // --- Commit -------------------------------------------------------------
  state_ = next;
  last_cascade_ = cascade.output;
  ++ticks_;

  domain::OutputRecord out;
  out.alert_active = fused.any;
  out.alert_priority = fused.priority;
  out.alert_type = fused.type;
  out.alert_bitmap = fused.bitmap;
  out.match_valid = book.match.valid;
  out.match_price = book.match.price;
  out.feature_valid = state_.features.valid;
  out.ml_valid = ml.valid;
  out.ml_class = static_cast<std::uint8_t>(state_.fusion.held);
  out.ml_confidence = state_.fusion.held_confidence;
  out.cascade_valid = cascade.output.valid;
  out.cascade_pattern = static_cast<std::uint8_t>(cascade.output.pattern);
  out.cb_mode = state_.breaker.mode;
  out.cb_active = state_.breaker.active;
  return out;
}

}  // namespace nanotrade
