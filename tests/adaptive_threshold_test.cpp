// =============================================================================
// adaptive_threshold_test.cpp
// =============================================================================
// Unit tests for stepThresholds() and integerSigma().
//
// Validates:
//   - Presets and Config-tick switching
//   - Adaptive thresholds only after 64 price samples and one tick's delay
//   - The first sample seeds the mean, so a flat market is at the floors of
//     10 / 15 from the first adaptive tick
//   - Sigma capped at 15 in a wild market
//   - adaptive_override forces the preset
// =============================================================================

#include "nanotrade/detect/adaptive_threshold.hpp"

#include <gtest/gtest.h>

using nanotrade::ThresholdState;
using nanotrade::domain::EngineConfig;
using nanotrade::domain::EventKind;
using nanotrade::domain::MarketEvent;
using nanotrade::domain::ThresholdPreset;
using nanotrade::domain::Thresholds;

class AdaptiveThresholdTest : public ::testing::Test {
 protected:
  EngineConfig config;
  ThresholdState state;

  void SetUp() override { state = nanotrade::initialThresholdState(config); }

  void feed(EventKind kind, std::uint16_t value) {
    state = nanotrade::stepThresholds(state, MarketEvent{kind, value}, config);
  }

  void alternate(int samples) {
    for (int i = 0; i < samples; ++i) {
      feed(EventKind::Price, i % 2 == 0 ? 100 : 140);
    }
  }
};

// -----------------------------------------------------------------------------
// 1. Preset table and Config switching.
// -----------------------------------------------------------------------------
TEST_F(AdaptiveThresholdTest, PresetsAndConfigTick) {
  EXPECT_EQ(state.active, (Thresholds{20, 40, 10}));

  feed(EventKind::Config, static_cast<std::uint16_t>(ThresholdPreset::Demo));
  EXPECT_EQ(state.preset, ThresholdPreset::Demo);
  EXPECT_EQ(state.active, (Thresholds{5, 10, 2}));

  feed(EventKind::Config, static_cast<std::uint16_t>(ThresholdPreset::Quiet));
  EXPECT_EQ(state.active, (Thresholds{60, 80, 20}));

  feed(EventKind::Config, static_cast<std::uint16_t>(ThresholdPreset::Sensitive));
  EXPECT_EQ(state.active, (Thresholds{10, 20, 5}));
}

// -----------------------------------------------------------------------------
// 2. initial_preset is in force before any tick.
// -----------------------------------------------------------------------------
TEST_F(AdaptiveThresholdTest, InitialPresetFromConfig) {
  config.initial_preset = ThresholdPreset::Quiet;
  state = nanotrade::initialThresholdState(config);
  EXPECT_EQ(state.preset, ThresholdPreset::Quiet);
  EXPECT_EQ(state.active, (Thresholds{60, 80, 20}));
}

// -----------------------------------------------------------------------------
// 3. With adaptation off the preset holds however volatile prices are.
// -----------------------------------------------------------------------------
TEST_F(AdaptiveThresholdTest, DisabledKeepsPreset) {
  alternate(200);
  EXPECT_EQ(state.active, (Thresholds{20, 40, 10}));
}

// -----------------------------------------------------------------------------
// 4. The 64th sample is registered but adaptation starts one tick later.
// -----------------------------------------------------------------------------
TEST_F(AdaptiveThresholdTest, AdaptsAfterSixtyFourSamples) {
  config.adaptive_thresholds = true;
  alternate(64);
  EXPECT_EQ(state.samples, nanotrade::kAdaptiveMinSamples);
  EXPECT_EQ(state.active, (Thresholds{20, 40, 10}));

  feed(EventKind::Price, 0);
  EXPECT_EQ(state.active, (Thresholds{45, 60, 10}));
}

// -----------------------------------------------------------------------------
// 5. A flat market is at the floors as soon as adaptation starts: the first
//    sample seeds the mean, so no variance builds up.
// -----------------------------------------------------------------------------
TEST_F(AdaptiveThresholdTest, FlatMarketHitsFloors) {
  config.adaptive_thresholds = true;
  feed(EventKind::Price, 100);
  EXPECT_EQ(state.mean_q >> 6, 100u);
  EXPECT_EQ(state.var_q, 0u);

  for (int i = 1; i < 64; ++i) feed(EventKind::Price, 100);
  EXPECT_EQ(state.active, (Thresholds{20, 40, 10}));

  feed(EventKind::Price, 100);  // sample 65
  EXPECT_EQ(state.active, (Thresholds{10, 15, 10}));

  for (int i = 0; i < 4000; ++i) feed(EventKind::Price, 100);
  EXPECT_EQ(state.mean_q >> 6, 100u);
  EXPECT_EQ(state.var_q >> 6, 0u);
  EXPECT_EQ(state.active, (Thresholds{10, 15, 10}));
}

// -----------------------------------------------------------------------------
// 6. The same holds far from zero.
// -----------------------------------------------------------------------------
TEST_F(AdaptiveThresholdTest, FlatHighPriceHitsFloors) {
  config.adaptive_thresholds = true;
  for (int i = 0; i < 65; ++i) feed(EventKind::Price, 2000);

  EXPECT_EQ(state.mean_q >> 6, 2000u);
  EXPECT_EQ(state.var_q, 0u);
  EXPECT_EQ(state.active, (Thresholds{10, 15, 10}));
}

// -----------------------------------------------------------------------------
// 7. A +/-20 oscillation keeps variance near 400; sigma caps at 15.
// -----------------------------------------------------------------------------
TEST_F(AdaptiveThresholdTest, VolatileMarketCapsSigma) {
  config.adaptive_thresholds = true;
  alternate(4000);
  EXPECT_GE(state.var_q >> 6, 225u);
  EXPECT_EQ(state.active.spike, 45);
  EXPECT_EQ(state.active.flash, 60);

  // The volume floor still follows the preset.
  feed(EventKind::Config, static_cast<std::uint16_t>(ThresholdPreset::Demo));
  EXPECT_EQ(state.active.volume_floor, 2);
}

// -----------------------------------------------------------------------------
// 8. adaptive_override pins the preset.
// -----------------------------------------------------------------------------
TEST_F(AdaptiveThresholdTest, OverrideForcesPreset) {
  config.adaptive_thresholds = true;
  config.adaptive_override = true;
  alternate(500);
  EXPECT_EQ(state.active, (Thresholds{20, 40, 10}));
}

// -----------------------------------------------------------------------------
// 9. integerSigma() is the floor square root, capped at 15.
// -----------------------------------------------------------------------------
TEST(IntegerSigmaTest, FloorSqrtCapped) {
  EXPECT_EQ(nanotrade::integerSigma(0), 0);
  EXPECT_EQ(nanotrade::integerSigma(3), 1);
  EXPECT_EQ(nanotrade::integerSigma(4), 2);
  EXPECT_EQ(nanotrade::integerSigma(224), 14);
  EXPECT_EQ(nanotrade::integerSigma(225), 15);
  EXPECT_EQ(nanotrade::integerSigma(100000), 15);
}
