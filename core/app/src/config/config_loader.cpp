#include "nanotrade/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace nanotrade {

namespace {

std::uint8_t boundedByte(const nlohmann::json& json, const char* key,
                         int max) {
  const int value = json.at(key).get<int>();
  if (value < 0 || value > max) {
    throw std::invalid_argument(std::string(key) + " out of range [0, " +
                                std::to_string(max) + "]: " +
                                std::to_string(value));
  }
  return static_cast<std::uint8_t>(value);
}

}  // namespace

domain::EngineConfig parseEngineConfig(const nlohmann::json& json) {
  domain::EngineConfig config;

  if (json.contains("preset")) {
    const std::string name = json.at("preset").get<std::string>();
    const auto preset = domain::presetFromName(name);
    if (!preset) {
      throw std::invalid_argument("unknown threshold preset: " + name);
    }
    config.initial_preset = *preset;
  }

  if (json.contains("adaptive_thresholds")) {
    config.adaptive_thresholds = json.at("adaptive_thresholds").get<bool>();
  }
  if (json.contains("adaptive_override")) {
    config.adaptive_override = json.at("adaptive_override").get<bool>();
  }
  if (json.contains("rule_trigger_confidence")) {
    config.rule_trigger_confidence =
        boundedByte(json, "rule_trigger_confidence", 255);
  }
  if (json.contains("widen_spread_guard")) {
    config.widen_spread_guard = boundedByte(json, "widen_spread_guard", 127);
  }
  if (json.contains("weights_dir")) {
    config.weights_dir = json.at("weights_dir").get<std::string>();
  }
  if (json.contains("market_data_endpoint")) {
    config.market_data_endpoint =
        json.at("market_data_endpoint").get<std::string>();
  }
  if (json.contains("ipc_cmd_endpoint")) {
    config.ipc_cmd_endpoint = json.at("ipc_cmd_endpoint").get<std::string>();
  }
  if (json.contains("ipc_pub_endpoint")) {
    config.ipc_pub_endpoint = json.at("ipc_pub_endpoint").get<std::string>();
  }

  return config;
}

domain::EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open config file: " + path);
  }
  return parseEngineConfig(nlohmann::json::parse(in));
}

}  // namespace nanotrade
