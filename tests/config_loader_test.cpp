// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for parseEngineConfig() and loadEngineConfig().
//
// Validates:
//   - `{}` yields the defaults
//   - Every recognised key is applied; unknown keys are ignored
//   - Preset names are case-insensitive; unknown names are rejected
//   - Out-of-range bytes, wrong types and missing files throw
// =============================================================================

#include "nanotrade/config/config_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <stdexcept>

using nanotrade::domain::EngineConfig;
using nanotrade::domain::ThresholdPreset;
using json = nlohmann::json;

// -----------------------------------------------------------------------------
// 1. Empty document: all defaults.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, EmptyDocumentKeepsDefaults) {
  const EngineConfig config = nanotrade::parseEngineConfig(json::object());

  EXPECT_EQ(config.initial_preset, ThresholdPreset::Normal);
  EXPECT_FALSE(config.adaptive_thresholds);
  EXPECT_FALSE(config.adaptive_override);
  EXPECT_EQ(config.rule_trigger_confidence, 60);
  EXPECT_EQ(config.widen_spread_guard, 2);
  EXPECT_TRUE(config.weights_dir.empty());
  EXPECT_EQ(config.market_data_endpoint, "tcp://127.0.0.1:5555");
  EXPECT_EQ(config.ipc_cmd_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.ipc_pub_endpoint, "tcp://127.0.0.1:5557");
}

// -----------------------------------------------------------------------------
// 2. Every key applied, endpoints may be emptied to disable a transport.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, AllKeys) {
  const json doc = {
      {"preset", "Demo"},
      {"adaptive_thresholds", true},
      {"adaptive_override", true},
      {"rule_trigger_confidence", 255},
      {"widen_spread_guard", 0},
      {"weights_dir", "model/"},
      {"market_data_endpoint", ""},
      {"ipc_cmd_endpoint", "ipc:///tmp/nanotrade.cmd"},
      {"ipc_pub_endpoint", ""},
      {"comment", "ignored"},
  };

  const EngineConfig config = nanotrade::parseEngineConfig(doc);
  EXPECT_EQ(config.initial_preset, ThresholdPreset::Demo);
  EXPECT_TRUE(config.adaptive_thresholds);
  EXPECT_TRUE(config.adaptive_override);
  EXPECT_EQ(config.rule_trigger_confidence, 255);
  EXPECT_EQ(config.widen_spread_guard, 0);
  EXPECT_EQ(config.weights_dir, "model/");
  EXPECT_TRUE(config.market_data_endpoint.empty());
  EXPECT_EQ(config.ipc_cmd_endpoint, "ipc:///tmp/nanotrade.cmd");
  EXPECT_TRUE(config.ipc_pub_endpoint.empty());
}

// -----------------------------------------------------------------------------
// 3. Rejections.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, InvalidValuesThrow) {
  EXPECT_THROW(nanotrade::parseEngineConfig({{"preset", "turbo"}}),
               std::invalid_argument);
  EXPECT_THROW(nanotrade::parseEngineConfig({{"rule_trigger_confidence", 256}}),
               std::invalid_argument);
  EXPECT_THROW(nanotrade::parseEngineConfig({{"widen_spread_guard", -1}}),
               std::invalid_argument);
  EXPECT_THROW(nanotrade::parseEngineConfig({{"widen_spread_guard", 128}}),
               std::invalid_argument);
  EXPECT_THROW(nanotrade::parseEngineConfig({{"adaptive_thresholds", "yes"}}),
               json::exception);
}

// -----------------------------------------------------------------------------
// 4. loadEngineConfig() reads a file and reports unreadable paths.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "nanotrade_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"preset": "quiet", "rule_trigger_confidence": 40})";
  }

  const EngineConfig config = nanotrade::loadEngineConfig(path);
  EXPECT_EQ(config.initial_preset, ThresholdPreset::Quiet);
  EXPECT_EQ(config.rule_trigger_confidence, 40);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(nanotrade::loadEngineConfig(path), json::parse_error);

  std::remove(path.c_str());
  EXPECT_THROW(nanotrade::loadEngineConfig(path), std::runtime_error);
}
