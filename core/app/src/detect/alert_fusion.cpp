#include "nanotrade/detect/alert_fusion.hpp"

namespace nanotrade {

AlertFusionState stepAlertFusion(const AlertFusionState& state,
                                  const MlResult& ml) {
  if (!ml.valid) {
    return state;
  }
  return AlertFusionState{ml.cls, ml.confidence};
}

domain::AlertRecord fuseAlerts(const domain::AlertRecord& rules,
                               const AlertFusionState& fusion) {
  const std::uint8_t ml_priority = domain::classPriority(fusion.held);
  const std::uint8_t rule_priority = rules.any ? rules.priority : 0;

  domain::AlertRecord fused;
  fused.any = rules.any || fusion.held != domain::AnomalyClass::Normal;
  fused.bitmap = rules.bitmap;

  if (rule_priority >= ml_priority) {
    fused.priority = rule_priority;
    fused.type = rules.type;
  } else {
    fused.priority = ml_priority;
    fused.type = static_cast<std::uint8_t>(fusion.held);
  }
  return fused;
}

}  // namespace nanotrade
