#pragma once

#include "nanotrade/domain/alert.hpp"
#include "nanotrade/domain/breaker.hpp"
#include "nanotrade/ml/ml_pipeline.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace nanotrade {

constexpr std::size_t kCascadeHistory = 3;
constexpr std::uint8_t kCascadeWindow = 64;

enum class CascadePattern : std::uint8_t {
  None = 0,
  VolCrash = 1,    // volume surge, then flash crash
  SpikeCrash = 2,  // price spike, then flash crash
  StuffCrash = 3,  // quote stuffing, then flash crash
  Triple = 4,      // two distinct precursors, then flash crash
};

const char* cascadePatternName(CascadePattern p);

struct CascadeEntry {
  domain::AnomalyClass cls{domain::AnomalyClass::Normal};
  std::uint8_t age{0};
  bool live{false};
};

// entries[0] is the newest observation.
struct CascadeState {
  std::array<CascadeEntry, kCascadeHistory> entries{};
};

struct CascadeOutput {
  bool valid{false};
  CascadePattern pattern{CascadePattern::None};
  domain::BreakerTrigger trigger;
};

struct CascadeStep {
  CascadeState next;
  CascadeOutput output;
};

// -----------------------------------------------------------------------------
// stepCascade(state, rule_class, ml, rule_confidence)
// -----------------------------------------------------------------------------
//
// @brief  Tracks recent anomaly classes and recognises precursor -> crash
//         sequences.
//
// @param  rule_class       Class of this tick's winning rule, if any.
// @param  ml               This tick's classifier result. Only a valid,
//                          non-NORMAL result is an observation.
// @param  rule_confidence  Confidence used when the crash came from a rule.
//
// @details
// Each tick every live entry ages by one and entries older than 64 ticks
// are dropped. Then up to two observations are applied, the rule class
// first and the ML class second:
//
//   - a class equal to the newest entry refreshes that entry's age;
//   - any other class is pushed as the newest entry, evicting the oldest.
//
// Observing FLASH_CRASH checks the other live entries. Two distinct
// precursor classes give TRIPLE; one gives VOL_CRASH, SPIKE_CRASH or
// STUFF_CRASH for volume surge, price spike or quote stuffing. On a match
// the output carries a cascade trigger (duration 4 x confidence) for this
// tick only and the history is cleared. A flash crash without a live
// precursor is recorded like any other class and never cascades on its
// own.
// -----------------------------------------------------------------------------
CascadeStep stepCascade(const CascadeState& state,
                        std::optional<domain::AnomalyClass> rule_class,
                        const MlResult& ml,
                        std::uint8_t rule_confidence);

}  // namespace nanotrade
