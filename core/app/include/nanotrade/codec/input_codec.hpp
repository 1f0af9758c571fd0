#pragma once

#include "nanotrade/domain/market_event.hpp"
#include "nanotrade/domain/thresholds.hpp"

#include <cstdint>

namespace nanotrade {

// -----------------------------------------------------------------------------
// Input decoder and 16-bit wire word
// -----------------------------------------------------------------------------
//
// @brief  Converts between the external input record, the 16-bit wire word
//         used by recorded stimulus streams, and the decoded MarketEvent.
//
// @details
// Wire word layout (word = ui << 8 | uio):
//
//   ui[7:6]   event type   00 price, 01 volume, 10 buy, 11 sell
//   ui[5:0]   value[5:0]   low six bits (the whole quantity for orders)
//   uio[5:0]  value[11:6]  high six bits (price / volume only)
//   uio[7]    config strobe; when set ui[1:0] is the preset code
//
// The all-zero word decodes to Price(0), the idle encoding.
//
// Every function here is pure and total: each 16-bit word decodes to
// exactly one event, and out-of-width values are masked rather than
// rejected.
// -----------------------------------------------------------------------------

// Applies the interface widths and resolves the config strobe.
domain::MarketEvent decodeInput(const domain::InputRecord& record);

domain::InputRecord decodeWord(std::uint16_t word);
std::uint16_t encodeWord(const domain::InputRecord& record);

std::uint16_t encodePrice(std::uint16_t price);
std::uint16_t encodeVolume(std::uint16_t volume);
std::uint16_t encodeBuy(std::uint8_t quantity);
std::uint16_t encodeSell(std::uint8_t quantity);
std::uint16_t encodeConfig(domain::ThresholdPreset preset);
inline constexpr std::uint16_t encodeIdle() { return 0x0000; }

}  // namespace nanotrade
