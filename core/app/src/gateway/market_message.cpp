#include "nanotrade/gateway/market_message.hpp"

#include "nanotrade/codec/input_codec.hpp"
#include "nanotrade/domain/thresholds.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace nanotrade {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// A 16-bit field; negative or wider values are rejected, not narrowed.
std::uint16_t wordField(const nlohmann::json& json, const char* key) {
  const std::int64_t value = json.at(key).get<std::int64_t>();
  if (value < 0 || value > 0xFFFF) {
    throw std::invalid_argument(std::string(key) + " out of range [0, 65535]: " +
                                std::to_string(value));
  }
  return static_cast<std::uint16_t>(value);
}

std::uint16_t valueField(const nlohmann::json& json) {
  return wordField(json, "value");
}

}  // namespace

domain::InputRecord parseMarketMessage(const std::string& payload) {
  const auto json = nlohmann::json::parse(payload);

  if (json.contains("word")) {
    return decodeWord(wordField(json, "word"));
  }

  const std::string kind = lower(json.at("kind").get<std::string>());
  domain::InputRecord record;

  if (kind == "idle") {
    return record;
  } else if (kind == "price") {
    record.kind = domain::EventKind::Price;
    record.value = valueField(json);
  } else if (kind == "volume") {
    record.kind = domain::EventKind::Volume;
    record.value = valueField(json);
  } else if (kind == "buy") {
    record.kind = domain::EventKind::Buy;
    record.value = valueField(json);
  } else if (kind == "sell") {
    record.kind = domain::EventKind::Sell;
    record.value = valueField(json);
  } else if (kind == "config") {
    record.kind = domain::EventKind::Config;
    record.config_strobe = true;
    if (json.contains("preset")) {
      const std::string name = json.at("preset").get<std::string>();
      const auto preset = domain::presetFromName(name);
      if (!preset) {
        throw std::invalid_argument("unknown preset: " + name);
      }
      record.value = static_cast<std::uint16_t>(*preset);
    } else {
      record.value = valueField(json);
    }
  } else {
    throw std::invalid_argument("unknown event kind: " + kind);
  }

  if (json.contains("strobe") && json.at("strobe").get<bool>()) {
    record.config_strobe = true;
  }
  return record;
}

}  // namespace nanotrade
