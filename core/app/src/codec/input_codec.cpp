#include "nanotrade/codec/input_codec.hpp"

namespace nanotrade {

namespace {

constexpr std::uint8_t kTypeShift = 6;
constexpr std::uint8_t kLowMask = 0x3F;
constexpr std::uint8_t kStrobeBit = 0x80;

std::uint8_t typeCode(domain::EventKind kind) {
  switch (kind) {
    case domain::EventKind::Price:  return 0b00;
    case domain::EventKind::Volume: return 0b01;
    case domain::EventKind::Buy:    return 0b10;
    case domain::EventKind::Sell:   return 0b11;
    case domain::EventKind::Config: return 0b00;
  }
  return 0b00;
}

domain::EventKind kindFromCode(std::uint8_t code) {
  switch (code & 0x3) {
    case 0b00: return domain::EventKind::Price;
    case 0b01: return domain::EventKind::Volume;
    case 0b10: return domain::EventKind::Buy;
    default:   return domain::EventKind::Sell;
  }
}

std::uint16_t pack(std::uint8_t ui, std::uint8_t uio) {
  return static_cast<std::uint16_t>((ui << 8) | uio);
}

}  // namespace

// -----------------------------------------------------------------------------
// decodeInput(): mask to interface widths, resolve the strobe
// -----------------------------------------------------------------------------
domain::MarketEvent decodeInput(const domain::InputRecord& record) {
  domain::MarketEvent event;

  if (record.config_strobe || record.kind == domain::EventKind::Config) {
    event.kind = domain::EventKind::Config;
    event.value = record.value & domain::kPresetMask;
    return event;
  }

  event.kind = record.kind;
  switch (record.kind) {
    case domain::EventKind::Price:
    case domain::EventKind::Volume:
      event.value = record.value & domain::kPriceMask;
      break;
    case domain::EventKind::Buy:
    case domain::EventKind::Sell:
      event.value = record.value & domain::kQuantityMask;
      break;
    case domain::EventKind::Config:
      break;
  }
  return event;
}

// -----------------------------------------------------------------------------
// decodeWord(): split ui/uio and reassemble the value
// -----------------------------------------------------------------------------
domain::InputRecord decodeWord(std::uint16_t word) {
  const auto ui = static_cast<std::uint8_t>(word >> 8);
  const auto uio = static_cast<std::uint8_t>(word & 0xFF);

  domain::InputRecord record;

  if ((uio & kStrobeBit) != 0) {
    record.kind = domain::EventKind::Config;
    record.config_strobe = true;
    record.value = ui & domain::kPresetMask;
    return record;
  }

  record.kind = kindFromCode(static_cast<std::uint8_t>(ui >> kTypeShift));
  const std::uint16_t low = ui & kLowMask;

  if (record.kind == domain::EventKind::Price ||
      record.kind == domain::EventKind::Volume) {
    const std::uint16_t high = uio & kLowMask;
    record.value = static_cast<std::uint16_t>((high << 6) | low);
  } else {
    record.value = low;
  }
  return record;
}

// -----------------------------------------------------------------------------
// encodeWord(): inverse of decodeWord() for in-range records
// -----------------------------------------------------------------------------
std::uint16_t encodeWord(const domain::InputRecord& record) {
  if (record.config_strobe || record.kind == domain::EventKind::Config) {
    return pack(static_cast<std::uint8_t>(record.value & domain::kPresetMask),
                kStrobeBit);
  }

  const std::uint8_t type =
      static_cast<std::uint8_t>(typeCode(record.kind) << kTypeShift);

  if (record.kind == domain::EventKind::Price ||
      record.kind == domain::EventKind::Volume) {
    const std::uint16_t v = record.value & domain::kPriceMask;
    return pack(static_cast<std::uint8_t>(type | (v & kLowMask)),
                static_cast<std::uint8_t>((v >> 6) & kLowMask));
  }

  return pack(static_cast<std::uint8_t>(
                  type | (record.value & domain::kQuantityMask)),
              0x00);
}

std::uint16_t encodePrice(std::uint16_t price) {
  return encodeWord({domain::EventKind::Price, price, false});
}

std::uint16_t encodeVolume(std::uint16_t volume) {
  return encodeWord({domain::EventKind::Volume, volume, false});
}

std::uint16_t encodeBuy(std::uint8_t quantity) {
  return encodeWord({domain::EventKind::Buy, quantity, false});
}

std::uint16_t encodeSell(std::uint8_t quantity) {
  return encodeWord({domain::EventKind::Sell, quantity, false});
}

std::uint16_t encodeConfig(domain::ThresholdPreset preset) {
  return encodeWord({domain::EventKind::Config,
                     static_cast<std::uint16_t>(preset), true});
}

}  // namespace nanotrade
