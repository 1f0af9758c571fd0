#pragma once

#include "nanotrade/domain/thresholds.hpp"

#include <cstdint>
#include <string>

namespace nanotrade {
namespace domain {

// -----------------------------------------------------------------------------
// EngineConfig — engine-wide immutable configuration
// -----------------------------------------------------------------------------
//
// @brief  Every tunable the detection engine reads at startup.
//
// @details
// Loaded once from JSON by loadEngineConfig() (config/config_loader.hpp) or
// default-constructed for tests. Copied by value into the components that
// need it; nothing reads it after startup except through those copies.
//
// The only runtime-changeable setting is the threshold preset, and that
// changes through a Config tick on the input stream, never by editing this
// struct. initial_preset is merely the preset in force at tick 0.
//
// Endpoint strings follow the transport convention of the runtime: an
// empty endpoint disables that transport (unit tests push ticks directly).
// -----------------------------------------------------------------------------
struct EngineConfig {
  /// Threshold preset in force from the first tick.
  ThresholdPreset initial_preset{ThresholdPreset::Normal};

  /// Derive spike/flash thresholds from online price variance instead of
  /// the preset once 64 price samples have been seen.
  bool adaptive_thresholds{false};

  /// Force preset thresholds even when adaptive_thresholds is set.
  bool adaptive_override{false};

  /// Confidence attached to the priority-7 rule fast path. The resulting
  /// Pause runs for 2 × this many ticks.
  std::uint8_t rule_trigger_confidence{60};

  /// Extra price levels a crossing must clear while widened.
  std::uint8_t widen_spread_guard{2};

  /// Directory holding w1.hex, b1.hex, w2.hex, b2.hex. Empty runs an
  /// all-zero model that classifies every snapshot as NORMAL.
  std::string weights_dir;

  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

}  // namespace domain
}  // namespace nanotrade
