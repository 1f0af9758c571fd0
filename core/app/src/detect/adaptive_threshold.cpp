#include "nanotrade/detect/adaptive_threshold.hpp"

#include <algorithm>
#include <array>

namespace nanotrade {

namespace {

// Squares of 0..15; sigma is the last entry not above the variance.
constexpr std::array<std::uint32_t, 16> kSquares = {
    0, 1, 4, 9, 16, 25, 36, 49, 64, 81, 100, 121, 144, 169, 196, 225};

}  // namespace

std::uint16_t integerSigma(std::uint32_t variance) {
  std::uint16_t sigma = 0;
  for (std::uint16_t s = 1; s < kSquares.size(); ++s) {
    if (kSquares[s] <= variance) {
      sigma = s;
    }
  }
  return sigma;
}

ThresholdState initialThresholdState(const domain::EngineConfig& config) {
  ThresholdState state;
  state.preset = config.initial_preset;
  state.active = domain::presetThresholds(config.initial_preset);
  return state;
}

ThresholdState stepThresholds(const ThresholdState& state,
                              const domain::MarketEvent& event,
                              const domain::EngineConfig& config) {
  ThresholdState next = state;

  if (event.kind == domain::EventKind::Config) {
    next.preset = domain::presetFromCode(event.value);
  }

  if (domain::isPriceSample(event)) {
    const std::int64_t price = event.value;
    const std::int64_t mean = state.mean_q >> 6;
    const std::int64_t d = price - mean;

    if (state.samples == 0) {
      // The first sample seeds the mean; variance starts at zero.
      next.mean_q = static_cast<std::uint32_t>(price) << 6;
      next.var_q = 0;
    } else {
      next.mean_q = static_cast<std::uint32_t>(state.mean_q - (state.mean_q >> 6) +
                                               event.value);
      next.var_q = static_cast<std::uint32_t>(state.var_q - (state.var_q >> 6) +
                                              static_cast<std::uint32_t>(d * d));
    }
    if (state.samples < kAdaptiveMinSamples) {
      next.samples = static_cast<std::uint8_t>(state.samples + 1);
    }
  }

  const domain::Thresholds preset = domain::presetThresholds(next.preset);
  const bool adaptive = config.adaptive_thresholds && !config.adaptive_override &&
                        state.samples >= kAdaptiveMinSamples;

  if (!adaptive) {
    next.active = preset;
    return next;
  }

  const std::uint16_t sigma = integerSigma(state.var_q >> 6);
  next.active.spike =
      std::max<std::uint16_t>(static_cast<std::uint16_t>(3 * sigma), kAdaptiveMinSpike);
  next.active.flash =
      std::max<std::uint16_t>(static_cast<std::uint16_t>(4 * sigma), kAdaptiveMinFlash);
  next.active.volume_floor = preset.volume_floor;
  return next;
}

}  // namespace nanotrade
