// =============================================================================
// ml_pipeline_test.cpp
// =============================================================================
// Unit tests for the classifier stages and stepMlPipeline().
//
// Validates:
//   - Hidden layer ReLU, >> 8 and clamp to 255
//   - Output logits in int32 with bias
//   - Argmax with strict >, so ties keep the lowest class
//   - Confidence (max - min) >> 8, clamped to 255
//   - Result valid four ticks after the feature pulse, for one tick
// =============================================================================

#include "nanotrade/ml/ml_pipeline.hpp"

#include <gtest/gtest.h>

#include <limits>

using nanotrade::FeatureExtractorState;
using nanotrade::MlPipelineState;
using nanotrade::MlResult;
using nanotrade::ModelWeights;
using nanotrade::domain::AnomalyClass;

namespace {

std::size_t w1Index(std::size_t input, std::size_t hidden) {
  return input * nanotrade::kModelHidden + hidden;
}

std::size_t w2Index(std::size_t hidden, std::size_t output) {
  return hidden * nanotrade::kModelOutputs + output;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Hidden layer: scaled dot product, ReLU, clamp.
// -----------------------------------------------------------------------------
TEST(MlPipelineTest, HiddenLayer) {
  ModelWeights w;
  w.w1[w1Index(0, 0)] = 256;
  w.b1[1] = -100;
  w.w1[w1Index(1, 2)] = 32767;

  nanotrade::FeatureVector f{};
  f[0] = 10;
  f[1] = 255;

  const auto h = nanotrade::hiddenLayer(f, w);
  EXPECT_EQ(h[0], 10);
  EXPECT_EQ(h[1], 0);    // negative bias, ReLU
  EXPECT_EQ(h[2], 255);  // 255 * 32767 >> 8 clamps
  EXPECT_EQ(h[3], 0);
}

// -----------------------------------------------------------------------------
// 2. Output layer: bias plus weighted hidden sum.
// -----------------------------------------------------------------------------
TEST(MlPipelineTest, OutputLayer) {
  ModelWeights w;
  w.w2[w2Index(0, 3)] = 300;
  w.w2[w2Index(1, 3)] = -5;
  w.b2[3] = 7;
  w.b2[4] = -1;

  std::array<std::uint8_t, nanotrade::kModelHidden> h{};
  h[0] = 10;
  h[1] = 200;

  const auto logits = nanotrade::outputLayer(h, w);
  EXPECT_EQ(logits[3], 7 + 3000 - 1000);
  EXPECT_EQ(logits[4], -1);
  EXPECT_EQ(logits[0], 0);
}

// -----------------------------------------------------------------------------
// 3. Argmax ties keep the lower class; confidence is the scaled spread.
// -----------------------------------------------------------------------------
TEST(MlPipelineTest, Classify) {
  MlResult r = nanotrade::classify({5, 5, 0, 0, 0, 0});
  EXPECT_EQ(r.cls, AnomalyClass::Normal);
  EXPECT_EQ(r.confidence, 0);
  EXPECT_TRUE(r.valid);

  r = nanotrade::classify({0, 512, 512, -1000, 0, 1000});
  EXPECT_EQ(r.cls, AnomalyClass::QuoteStuffing);
  EXPECT_EQ(r.confidence, 7);  // 2000 >> 8

  r = nanotrade::classify({0, 0, 0, std::numeric_limits<std::int32_t>::max(),
                           std::numeric_limits<std::int32_t>::min(), 0});
  EXPECT_EQ(r.cls, AnomalyClass::FlashCrash);
  EXPECT_EQ(r.confidence, 255);
}

// -----------------------------------------------------------------------------
// 4. A zero model with b2 = {512, 0, ...} scores NORMAL with confidence 2.
// -----------------------------------------------------------------------------
TEST(MlPipelineTest, BiasOnlyModelIsNormal) {
  ModelWeights w;
  w.b2[0] = 512;

  nanotrade::FeatureVector f{};
  f.fill(128);
  const auto r = nanotrade::classify(
      nanotrade::outputLayer(nanotrade::hiddenLayer(f, w), w));
  EXPECT_EQ(r.cls, AnomalyClass::Normal);
  EXPECT_EQ(r.confidence, 2);
}

// -----------------------------------------------------------------------------
// 5. Latency: the pulse fed on call 1 produces a result on call 4 only.
// -----------------------------------------------------------------------------
TEST(MlPipelineTest, FourStageLatency) {
  ModelWeights w;
  w.b2[2] = 1024;

  FeatureExtractorState pulse;
  pulse.valid = true;
  FeatureExtractorState quiet;

  MlPipelineState state;
  state = nanotrade::stepMlPipeline(state, pulse, w);
  EXPECT_TRUE(state.input_valid);
  EXPECT_FALSE(state.result.valid);

  state = nanotrade::stepMlPipeline(state, quiet, w);
  EXPECT_TRUE(state.hidden_valid);
  EXPECT_FALSE(state.result.valid);

  state = nanotrade::stepMlPipeline(state, quiet, w);
  EXPECT_TRUE(state.logits_valid);
  EXPECT_FALSE(state.result.valid);

  state = nanotrade::stepMlPipeline(state, quiet, w);
  ASSERT_TRUE(state.result.valid);
  EXPECT_EQ(state.result.cls, AnomalyClass::VolumeSurge);
  EXPECT_EQ(state.result.confidence, 4);

  state = nanotrade::stepMlPipeline(state, quiet, w);
  EXPECT_FALSE(state.result.valid);
}
