#pragma once

#include "nanotrade/domain/breaker.hpp"
#include "nanotrade/domain/engine_config.hpp"
#include "nanotrade/domain/output_record.hpp"
#include "nanotrade/domain/thresholds.hpp"
#include "nanotrade/engine/tick_pipeline.hpp"
#include "nanotrade/eventbus/event_bus.hpp"
#include "nanotrade/events/event_types.hpp"
#include "nanotrade/ml/model_weights.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>

namespace nanotrade {

// -----------------------------------------------------------------------------
// EngineStatus
// -----------------------------------------------------------------------------
// Point-in-time copy of the tick processor's counters for the STATUS
// command. Refreshed at the end of every tick.
// -----------------------------------------------------------------------------
struct EngineStatus {
  std::uint64_t ticks{0};
  domain::ThresholdPreset preset{domain::ThresholdPreset::Normal};
  domain::Thresholds thresholds;
  domain::BreakerMode breaker_mode{domain::BreakerMode::Normal};
  std::uint16_t breaker_countdown{0};
  std::size_t bids{0};
  std::size_t asks{0};
  std::uint64_t alerts{0};
  std::uint64_t matches{0};
  std::uint64_t classifications{0};
  std::uint64_t cascades{0};
  domain::OutputRecord last_output;
};

// -----------------------------------------------------------------------------
// TickProcessor
// -----------------------------------------------------------------------------
//
// @brief  Runs the TickPipeline on the tick loop and publishes what it
//         produces.
//
// @details
// Subscribes to MarketTickEvent on the bus it is given. For each tick it:
//   1. steps the pipeline with the event's input record;
//   2. publishes a TickReportEvent carrying the output record;
//   3. publishes a CascadeEvent on the tick a cascade completes;
//   4. publishes a BreakerTransitionEvent whenever the breaker mode changes.
// Cascades and breaker transitions are also logged to stdout.
//
// Thread model:
//   onTick() runs only on the tick loop thread (the bus's publisher), so the
//   pipeline itself needs no locking. status() may be called from any
//   thread; the snapshot is guarded by status_mutex_.
//
// Ownership:
//   Owned by DetectionEngine via std::unique_ptr. Holds a reference to the
//   bus and, through the pipeline, to the model weights; both must outlive
//   it. Unsubscribes in the destructor.
// -----------------------------------------------------------------------------
class TickProcessor {
 public:
  TickProcessor(EventBus& bus, const domain::EngineConfig& config,
                const ModelWeights& weights);

  ~TickProcessor();

  TickProcessor(const TickProcessor&) = delete;
  TickProcessor& operator=(const TickProcessor&) = delete;
  TickProcessor(TickProcessor&&) = delete;
  TickProcessor& operator=(TickProcessor&&) = delete;

  // Thread-safe copy of the latest counters.
  EngineStatus status() const;

 private:
  void onTick(const MarketTickEvent& event);

  EventBus& bus_;
  EventBus::SubscriptionId tick_sub_id_{0};

  TickPipeline pipeline_;

  mutable std::mutex status_mutex_;
  EngineStatus status_;
};

}  // namespace nanotrade
