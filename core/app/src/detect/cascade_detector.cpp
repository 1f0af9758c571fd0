#include "nanotrade/detect/cascade_detector.hpp"

namespace nanotrade {

namespace {

using domain::AnomalyClass;

CascadePattern precursorPattern(AnomalyClass precursor) {
  switch (precursor) {
    case AnomalyClass::VolumeSurge:   return CascadePattern::VolCrash;
    case AnomalyClass::PriceSpike:    return CascadePattern::SpikeCrash;
    case AnomalyClass::QuoteStuffing: return CascadePattern::StuffCrash;
    default:                          return CascadePattern::None;
  }
}

// Pattern a flash crash would complete against the current history.
CascadePattern matchPattern(const CascadeState& state) {
  std::optional<AnomalyClass> first;
  for (const auto& e : state.entries) {
    if (!e.live || e.cls == AnomalyClass::FlashCrash) {
      continue;
    }
    if (!first) {
      first = e.cls;
    } else if (e.cls != *first) {
      return CascadePattern::Triple;
    }
  }
  return first ? precursorPattern(*first) : CascadePattern::None;
}

void record(CascadeState& state, AnomalyClass cls) {
  CascadeEntry& newest = state.entries[0];
  if (newest.live && newest.cls == cls) {
    newest.age = 0;
    return;
  }
  for (std::size_t i = state.entries.size() - 1; i > 0; --i) {
    state.entries[i] = state.entries[i - 1];
  }
  state.entries[0] = CascadeEntry{cls, 0, true};
}

// Applies one observation. At most one cascade is reported per tick.
void observe(CascadeState& state, AnomalyClass cls, std::uint8_t confidence,
             CascadeOutput& out) {
  if (cls == AnomalyClass::FlashCrash && !out.valid) {
    const CascadePattern pattern = matchPattern(state);
    if (pattern != CascadePattern::None) {
      out.valid = true;
      out.pattern = pattern;
      out.trigger = domain::cascadeTrigger(AnomalyClass::FlashCrash, confidence);
      state = CascadeState{};
      return;
    }
  }
  record(state, cls);
}

}  // namespace

const char* cascadePatternName(CascadePattern p) {
  switch (p) {
    case CascadePattern::None:       return "NONE";
    case CascadePattern::VolCrash:   return "VOL_CRASH";
    case CascadePattern::SpikeCrash: return "SPIKE_CRASH";
    case CascadePattern::StuffCrash: return "STUFF_CRASH";
    case CascadePattern::Triple:     return "TRIPLE";
  }
  return "UNKNOWN";
}

CascadeStep stepCascade(const CascadeState& state,
                        std::optional<domain::AnomalyClass> rule_class,
                        const MlResult& ml,
                        std::uint8_t rule_confidence) {
  CascadeStep step{state, CascadeOutput{}};

  for (auto& e : step.next.entries) {
    if (!e.live) {
      continue;
    }
    if (e.age >= kCascadeWindow) {
      e = CascadeEntry{};
    } else {
      ++e.age;
    }
  }

  if (rule_class && *rule_class != AnomalyClass::Normal) {
    observe(step.next, *rule_class, rule_confidence, step.output);
  }

  if (ml.valid && ml.cls != AnomalyClass::Normal) {
    observe(step.next, ml.cls, ml.confidence, step.output);
  }

  return step;
}

}  // namespace nanotrade
