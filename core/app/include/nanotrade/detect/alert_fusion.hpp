#pragma once

#include "nanotrade/domain/alert.hpp"
#include "nanotrade/ml/ml_pipeline.hpp"

namespace nanotrade {

// Last classifier verdict. Replaced whenever a new result is valid.
struct AlertFusionState {
  domain::AnomalyClass held{domain::AnomalyClass::Normal};
  std::uint8_t held_confidence{0};
};

AlertFusionState stepAlertFusion(const AlertFusionState& state,
                                  const MlResult& ml);

// -----------------------------------------------------------------------------
// fuseAlerts(rules, fusion)
// -----------------------------------------------------------------------------
//
// @brief  Merges the rule detector's verdict with the held ML verdict.
//
// @details
// any      = rules.any || held != NORMAL
// priority = max(rule priority, class priority of held)
// type     = rule type when its priority is >= the ML priority, otherwise
//            the held class code
// bitmap   = rule bitmap, unchanged
// -----------------------------------------------------------------------------
domain::AlertRecord fuseAlerts(const domain::AlertRecord& rules,
                               const AlertFusionState& fusion);

}  // namespace nanotrade
