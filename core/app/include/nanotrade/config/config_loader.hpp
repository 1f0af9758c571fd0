#pragma once

#include "nanotrade/domain/engine_config.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace nanotrade {

// -----------------------------------------------------------------------------
// Engine configuration loader
// -----------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from a JSON document.
//
// @details
// Every key is optional; a missing key keeps the EngineConfig default, so
// `{}` is a valid configuration. Recognised keys:
//
//   {
//     "preset":                  "normal",   // quiet|normal|sensitive|demo
//     "adaptive_thresholds":     false,
//     "adaptive_override":       false,
//     "rule_trigger_confidence": 60,         // 0..255
//     "widen_spread_guard":      2,          // 0..127
//     "weights_dir":             "weights/",
//     "market_data_endpoint":    "tcp://127.0.0.1:5555",
//     "ipc_cmd_endpoint":        "tcp://127.0.0.1:5556",
//     "ipc_pub_endpoint":        "tcp://127.0.0.1:5557"
//   }
//
// Unknown keys are ignored.
//
// Errors:
//   - nlohmann::json::exception for malformed JSON or a value of the wrong
//     type;
//   - std::invalid_argument for an unknown preset name or an out-of-range
//     number;
//   - std::runtime_error if the file cannot be opened.
// -----------------------------------------------------------------------------
domain::EngineConfig parseEngineConfig(const nlohmann::json& json);

domain::EngineConfig loadEngineConfig(const std::string& path);

}  // namespace nanotrade
