#pragma once

#include "nanotrade/domain/breaker.hpp"

#include <cstdint>

namespace nanotrade {
namespace domain {

// -----------------------------------------------------------------------------
// OutputRecord
// -----------------------------------------------------------------------------
//
// @brief  Everything the engine reports for one tick.
//
// @details
// Alert fields are the fused rule + ML verdict for this tick's input. The
// remaining fields are the committed state at the end of the tick: match
// output, the feature and classifier pulses, the cascade pulse and the
// breaker mode that governs the order book on the next tick.
//
// ml_class / ml_confidence hold the last valid classifier result between
// pulses; ml_valid marks the tick a new one arrived.
// -----------------------------------------------------------------------------
struct OutputRecord {
  bool alert_active{false};
  std::uint8_t alert_priority{0};
  std::uint8_t alert_type{0};
  std::uint8_t alert_bitmap{0};

  bool match_valid{false};
  std::uint8_t match_price{0};

  bool feature_valid{false};
  bool ml_valid{false};
  std::uint8_t ml_class{0};
  std::uint8_t ml_confidence{0};

  bool cascade_valid{false};
  std::uint8_t cascade_pattern{0};

  BreakerMode cb_mode{BreakerMode::Normal};
  bool cb_active{false};
};

}  // namespace domain
}  // namespace nanotrade
