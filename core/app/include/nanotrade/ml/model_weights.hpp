#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nanotrade {

constexpr std::size_t kModelInputs = 16;
constexpr std::size_t kModelHidden = 8;
constexpr std::size_t kModelOutputs = 6;

// -----------------------------------------------------------------------------
// ModelWeights
// -----------------------------------------------------------------------------
//
// @brief  Fixed-point parameters of the two-layer anomaly classifier.
//
// @details
// W1 is row-major [input][hidden], W2 is row-major [hidden][output], both
// int16. Loaded once at startup and never modified; the ML pipeline only
// holds a const reference.
//
// A default-constructed ModelWeights is all zeros. That model scores every
// class equally, so argmax keeps class 0 (NORMAL) with confidence 0.
// -----------------------------------------------------------------------------
struct ModelWeights {
  std::array<std::int16_t, kModelInputs * kModelHidden> w1{};
  std::array<std::int16_t, kModelHidden> b1{};
  std::array<std::int16_t, kModelHidden * kModelOutputs> w2{};
  std::array<std::int16_t, kModelOutputs> b2{};

  std::int16_t layer1(std::size_t input, std::size_t hidden) const {
    return w1[input * kModelHidden + hidden];
  }
  std::int16_t layer2(std::size_t hidden, std::size_t output) const {
    return w2[hidden * kModelOutputs + output];
  }
};

// -----------------------------------------------------------------------------
// loadModelWeights(directory)
// -----------------------------------------------------------------------------
//
// @brief  Reads w1.hex, b1.hex, w2.hex and b2.hex from a directory.
//
// @throws std::runtime_error if a file cannot be opened, a line is not a
//         1-4 digit hex value, or a file holds the wrong number of values.
//
// @details
// One value per line as written by the offline trainer: up to four hex
// digits, 16-bit two's complement. Blank lines and `//` comments are
// skipped.
// -----------------------------------------------------------------------------
ModelWeights loadModelWeights(const std::string& directory);

// Reads every value from a single .hex file.
std::vector<std::int16_t> readHexFile(const std::string& path);

}  // namespace nanotrade
