#pragma once

#include "nanotrade/book/order_book.hpp"
#include "nanotrade/detect/adaptive_threshold.hpp"
#include "nanotrade/detect/alert_fusion.hpp"
#include "nanotrade/detect/cascade_detector.hpp"
#include "nanotrade/domain/engine_config.hpp"
#include "nanotrade/domain/market_event.hpp"
#include "nanotrade/domain/output_record.hpp"
#include "nanotrade/ml/feature_extractor.hpp"
#include "nanotrade/ml/ml_pipeline.hpp"
#include "nanotrade/ml/model_weights.hpp"
#include "nanotrade/risk/circuit_breaker.hpp"
#include "nanotrade/stats/rolling_statistics.hpp"

#include <cstdint>

namespace nanotrade {

// -----------------------------------------------------------------------------
// PipelineState
// -----------------------------------------------------------------------------
// The complete engine state between two ticks. Every component owns exactly
// one member; nothing outside the pipeline writes it.
// -----------------------------------------------------------------------------
struct PipelineState {
  OrderBookState book;
  RollingStatistics stats;
  ThresholdState thresholds;
  FeatureExtractorState features;
  MlPipelineState ml;
  AlertFusionState fusion;
  CascadeState cascade;
  CircuitBreakerState breaker;
};

// -----------------------------------------------------------------------------
// TickPipeline
// -----------------------------------------------------------------------------
//
// @brief  The deterministic per-tick function composing every detection and
//         mitigation component.
//
// @details
// step() is a two-phase update. Every component computes its next state
// from `state_` as it stood when the tick began; only after all of them
// have run is the whole PipelineState replaced. No component observes
// another's update from the same tick, so evaluation order inside step()
// never changes the result.
//
// Latencies that follow from this:
//   - a breaker decision reaches the order book one tick later;
//   - a Config preset reaches the rule detector one tick later;
//   - the classifier result is valid four ticks after feature_valid.
//
// Thread model:
//   Not thread-safe. Owned by exactly one thread (the tick loop in the
//   runtime, the test body in unit tests). No I/O, no logging, no
//   allocation after construction.
//
// Ownership:
//   Holds a copy of the EngineConfig and a const reference to the model
//   weights, which must outlive the pipeline.
// -----------------------------------------------------------------------------
class TickPipeline {
 public:
  TickPipeline(const domain::EngineConfig& config, const ModelWeights& weights);

  TickPipeline(const TickPipeline&) = delete;
  TickPipeline& operator=(const TickPipeline&) = delete;

  // -------------------------------------------------------------------------
  // step(input)
  // -------------------------------------------------------------------------
  //
  // @brief  Consumes one input record and advances every component.
  //
  // @param  input  This tick's external input record (unmasked).
  //
  // @return The tick's OutputRecord.
  // -------------------------------------------------------------------------
  domain::OutputRecord step(const domain::InputRecord& input);

  // Restores the power-on state. The tick counter restarts at 0.
  void reset();

  const PipelineState& state() const { return state_; }
  std::uint64_t ticks() const { return ticks_; }

  // Cascade output of the most recent step, including the trigger it
  // handed to the breaker when valid.
  const CascadeOutput& lastCascade() const { return last_cascade_; }

 private:
  domain::EngineConfig config_;
  const ModelWeights& weights_;
  PipelineState state_;
  std::uint64_t ticks_{0};
  CascadeOutput last_cascade_;
};

}  // namespace nanotrade
