#pragma once

#include "nanotrade/domain/market_event.hpp"

#include <string>

namespace nanotrade {

// -----------------------------------------------------------------------------
// parseMarketMessage(payload)
// -----------------------------------------------------------------------------
//
// @brief  Decodes one JSON market-data message into an input record.
//
// @details
// Two forms are accepted:
//
//   {"word": 25700}
//       A recorded 16-bit wire word (see codec/input_codec.hpp).
//
//   {"kind": "price", "value": 100}
//   {"kind": "buy",   "value": 10}
//   {"kind": "config", "preset": "demo"}       // or "value": 3
//   {"kind": "idle"}
//       kind is price|volume|buy|sell|config|idle, case-insensitive. An
//       optional boolean "strobe" forces a Config event as on the wire.
//
// Values are not range-checked here; the input decoder masks them to the
// interface widths like any other input.
//
// @throws nlohmann::json::exception  malformed JSON, missing or mistyped
//                                    fields.
// @throws std::invalid_argument      unknown kind or preset name.
// -----------------------------------------------------------------------------
domain::InputRecord parseMarketMessage(const std::string& payload);

}  // namespace nanotrade
