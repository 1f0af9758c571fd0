#pragma once

#include "nanotrade/domain/alert.hpp"
#include "nanotrade/ml/feature_extractor.hpp"
#include "nanotrade/ml/model_weights.hpp"

#include <array>
#include <cstdint>

namespace nanotrade {

// -----------------------------------------------------------------------------
// MlResult
// -----------------------------------------------------------------------------
// valid is raised for exactly one tick per classified snapshot.
// -----------------------------------------------------------------------------
struct MlResult {
  domain::AnomalyClass cls{domain::AnomalyClass::Normal};
  std::uint8_t confidence{0};
  bool valid{false};
};

// -----------------------------------------------------------------------------
// MlPipelineState
// -----------------------------------------------------------------------------
//
// @brief  The four stage registers of the classifier.
//
// @details
//   stage 0  latched feature vector
//   stage 1  8 hidden activations, 0..255
//   stage 2  6 output logits, int32
//   stage 3  argmax result
//
// Every stage advances every tick, so a snapshot entering stage 0 on tick
// t reaches stage 3 on tick t + 3. Counting the latch, the result is valid
// four ticks after feature_valid.
// -----------------------------------------------------------------------------
struct MlPipelineState {
  FeatureVector input{};
  bool input_valid{false};

  std::array<std::uint8_t, kModelHidden> hidden{};
  bool hidden_valid{false};

  std::array<std::int32_t, kModelOutputs> logits{};
  bool logits_valid{false};

  MlResult result;
};

// -----------------------------------------------------------------------------
// stepMlPipeline(state, features, weights)
// -----------------------------------------------------------------------------
//
// @brief  Shifts every stage forward by one tick.
//
// @param  features  Feature extractor output committed on the previous tick.
//
// @details
// Layer 1: acc = b1[h] + sum(f[i] * w1[i][h]) in int32, then ReLU, >> 8 and
//          clamp to 255.
// Layer 2: logit[o] = b2[o] + sum(h[j] * w2[j][o]) in int32.
// Argmax:  strict >, so a tie keeps the lowest class index. Confidence is
//          (max - min) >> 8 clamped to 255.
// -----------------------------------------------------------------------------
MlPipelineState stepMlPipeline(const MlPipelineState& state,
                               const FeatureExtractorState& features,
                               const ModelWeights& weights);

// The individual stages, exposed for tests.
std::array<std::uint8_t, kModelHidden> hiddenLayer(const FeatureVector& input,
                                                   const ModelWeights& weights);
std::array<std::int32_t, kModelOutputs> outputLayer(
    const std::array<std::uint8_t, kModelHidden>& hidden,
    const ModelWeights& weights);
MlResult classify(const std::array<std::int32_t, kModelOutputs>& logits);

}  // namespace nanotrade
