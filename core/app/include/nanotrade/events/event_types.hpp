#pragma once

#include "nanotrade/detect/cascade_detector.hpp"
#include "nanotrade/domain/breaker.hpp"
#include "nanotrade/domain/market_event.hpp"
#include "nanotrade/domain/output_record.hpp"

#include <chrono>
#include <cstdint>

namespace nanotrade {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock receive time. Informational only: the pipeline is driven by
// tick count, never by time.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// MarketTickEvent
// -----------------------------------------------------------------------------
// Responsibility: One input record on its way to the tick loop. Produced by
// the market-data gateway, the IPC PRESET command and tests. Every
// MarketTickEvent becomes exactly one pipeline tick.
// -----------------------------------------------------------------------------
struct MarketTickEvent {
  domain::InputRecord input;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TickReportEvent
// -----------------------------------------------------------------------------
// Responsibility: The pipeline's output for one tick, published on the tick
// loop right after the step. Read-only consumers (telemetry, tests) subscribe
// to this; nothing feeds back into the pipeline.
// -----------------------------------------------------------------------------
struct TickReportEvent {
  std::uint64_t tick{0};
  domain::InputRecord input;
  domain::OutputRecord output;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// BreakerTransitionEvent
// -----------------------------------------------------------------------------
// Published whenever the circuit breaker changes mode: once when an
// intervention is accepted and once when it expires.
// -----------------------------------------------------------------------------
struct BreakerTransitionEvent {
  std::uint64_t tick{0};
  domain::BreakerMode from{domain::BreakerMode::Normal};
  domain::BreakerMode to{domain::BreakerMode::Normal};
  std::uint16_t countdown{0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// CascadeEvent
// -----------------------------------------------------------------------------
// Published on the tick a cascade pattern completes.
// -----------------------------------------------------------------------------
struct CascadeEvent {
  std::uint64_t tick{0};
  CascadePattern pattern{CascadePattern::None};
  std::uint8_t confidence{0};
  std::uint16_t duration{0};
  Timestamp timestamp{};
};

}  // namespace nanotrade
