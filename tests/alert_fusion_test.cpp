// =============================================================================
// alert_fusion_test.cpp
// =============================================================================
// Unit tests for stepAlertFusion() and fuseAlerts().
//
// Validates:
//   - The held verdict changes only on a valid classifier result
//   - A held non-NORMAL verdict raises alert_any on its own
//   - The higher priority wins; equal priorities go to the rule
//   - The bitmap is the rule bitmap, untouched by the classifier
// =============================================================================

#include "nanotrade/detect/alert_fusion.hpp"

#include <gtest/gtest.h>

using nanotrade::AlertFusionState;
using nanotrade::MlResult;
using nanotrade::domain::AlertRecord;
using nanotrade::domain::AlertType;
using nanotrade::domain::AnomalyClass;

namespace {

AlertRecord ruleAlert(AlertType type) {
  AlertRecord r;
  r.any = true;
  r.priority = nanotrade::domain::alertPriority(type);
  r.type = static_cast<std::uint8_t>(type);
  r.bitmap = nanotrade::domain::bitOf(type);
  return r;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Holding: invalid results leave the previous verdict in place.
// -----------------------------------------------------------------------------
TEST(AlertFusionTest, HoldsLastValidVerdict) {
  AlertFusionState state;
  state = nanotrade::stepAlertFusion(state, MlResult{AnomalyClass::VolumeSurge, 40, true});
  EXPECT_EQ(state.held, AnomalyClass::VolumeSurge);
  EXPECT_EQ(state.held_confidence, 40);

  state = nanotrade::stepAlertFusion(state, MlResult{AnomalyClass::FlashCrash, 99, false});
  EXPECT_EQ(state.held, AnomalyClass::VolumeSurge);

  state = nanotrade::stepAlertFusion(state, MlResult{AnomalyClass::Normal, 3, true});
  EXPECT_EQ(state.held, AnomalyClass::Normal);
  EXPECT_EQ(state.held_confidence, 3);
}

// -----------------------------------------------------------------------------
// 2. Quiet rules plus a held QUOTE_STUFFING verdict: the verdict surfaces.
// -----------------------------------------------------------------------------
TEST(AlertFusionTest, ClassifierAloneRaisesAlert) {
  const AlertFusionState held{AnomalyClass::QuoteStuffing, 70};
  const AlertRecord fused = nanotrade::fuseAlerts(AlertRecord{}, held);

  EXPECT_TRUE(fused.any);
  EXPECT_EQ(fused.priority, 3);
  EXPECT_EQ(fused.type, static_cast<std::uint8_t>(AnomalyClass::QuoteStuffing));
  EXPECT_EQ(fused.bitmap, 0);
}

// -----------------------------------------------------------------------------
// 3. Both quiet: nothing.
// -----------------------------------------------------------------------------
TEST(AlertFusionTest, BothQuiet) {
  const AlertRecord fused = nanotrade::fuseAlerts(AlertRecord{}, AlertFusionState{});
  EXPECT_FALSE(fused.any);
  EXPECT_EQ(fused.priority, 0);
  EXPECT_EQ(fused.type, 0);
}

// -----------------------------------------------------------------------------
// 4. Priority race, with ties going to the rule.
// -----------------------------------------------------------------------------
TEST(AlertFusionTest, PriorityRace) {
  // Rule 7 beats ML 5.
  auto fused = nanotrade::fuseAlerts(ruleAlert(AlertType::FlashCrash),
                                     AlertFusionState{AnomalyClass::VolumeSurge, 1});
  EXPECT_EQ(fused.priority, 7);
  EXPECT_EQ(fused.type, static_cast<std::uint8_t>(AlertType::FlashCrash));

  // ML 7 beats rule 4.
  fused = nanotrade::fuseAlerts(ruleAlert(AlertType::OrderImbalance),
                                AlertFusionState{AnomalyClass::FlashCrash, 1});
  EXPECT_EQ(fused.priority, 7);
  EXPECT_EQ(fused.type, static_cast<std::uint8_t>(AnomalyClass::FlashCrash));
  EXPECT_EQ(fused.bitmap, nanotrade::domain::bitOf(AlertType::OrderImbalance));

  // Tie at 6: the rule's type code is kept.
  fused = nanotrade::fuseAlerts(ruleAlert(AlertType::PriceSpike),
                                AlertFusionState{AnomalyClass::PriceSpike, 1});
  EXPECT_EQ(fused.priority, 6);
  EXPECT_EQ(fused.type, static_cast<std::uint8_t>(AlertType::PriceSpike));
}
