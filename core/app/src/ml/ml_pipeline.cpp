#include "nanotrade/ml/ml_pipeline.hpp"

#include <algorithm>

namespace nanotrade {

std::array<std::uint8_t, kModelHidden> hiddenLayer(const FeatureVector& input,
                                                   const ModelWeights& weights) {
  std::array<std::uint8_t, kModelHidden> hidden{};
  for (std::size_t h = 0; h < kModelHidden; ++h) {
    std::int32_t acc = weights.b1[h];
    for (std::size_t i = 0; i < kModelInputs; ++i) {
      acc += static_cast<std::int32_t>(input[i]) * weights.layer1(i, h);
    }
    const std::int32_t activated = std::max<std::int32_t>(acc, 0) >> 8;
    hidden[h] = static_cast<std::uint8_t>(std::min<std::int32_t>(activated, 255));
  }
  return hidden;
}

std::array<std::int32_t, kModelOutputs> outputLayer(
    const std::array<std::uint8_t, kModelHidden>& hidden,
    const ModelWeights& weights) {
  std::array<std::int32_t, kModelOutputs> logits{};
  for (std::size_t o = 0; o < kModelOutputs; ++o) {
    std::int32_t acc = weights.b2[o];
    for (std::size_t j = 0; j < kModelHidden; ++j) {
      acc += static_cast<std::int32_t>(hidden[j]) * weights.layer2(j, o);
    }
    logits[o] = acc;
  }
  return logits;
}

MlResult classify(const std::array<std::int32_t, kModelOutputs>& logits) {
  std::size_t best = 0;
  std::int32_t max = logits[0];
  std::int32_t min = logits[0];
  for (std::size_t o = 1; o < kModelOutputs; ++o) {
    if (logits[o] > max) {
      max = logits[o];
      best = o;
    }
    min = std::min(min, logits[o]);
  }

  const std::int64_t margin =
      (static_cast<std::int64_t>(max) - static_cast<std::int64_t>(min)) >> 8;

  MlResult result;
  result.cls = static_cast<domain::AnomalyClass>(best);
  result.confidence = static_cast<std::uint8_t>(std::min<std::int64_t>(margin, 255));
  result.valid = true;
  return result;
}

MlPipelineState stepMlPipeline(const MlPipelineState& state,
                               const FeatureExtractorState& features,
                               const ModelWeights& weights) {
  MlPipelineState next = state;

  // Stage 3 <- stage 2
  if (state.logits_valid) {
    next.result = classify(state.logits);
  } else {
    next.result.valid = false;
  }

  // Stage 2 <- stage 1
  next.logits_valid = state.hidden_valid;
  if (state.hidden_valid) {
    next.logits = outputLayer(state.hidden, weights);
  }

  // Stage 1 <- stage 0
  next.hidden_valid = state.input_valid;
  if (state.input_valid) {
    next.hidden = hiddenLayer(state.input, weights);
  }

  // Stage 0 <- feature extractor
  next.input_valid = features.valid;
  if (features.valid) {
    next.input = features.features;
  }

  return next;
}

}  // namespace nanotrade
