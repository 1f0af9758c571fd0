#include "nanotrade/ml/model_weights.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace nanotrade {

namespace {

std::string trim(const std::string& s) {
  const auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  const auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                     return std::isspace(c);
                   }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

template <std::size_t N>
void loadInto(std::array<std::int16_t, N>& dest, const std::string& path) {
  const std::vector<std::int16_t> values = readHexFile(path);
  if (values.size() != N) {
    throw std::runtime_error(path + ": expected " + std::to_string(N) +
                             " values, found " + std::to_string(values.size()));
  }
  std::copy(values.begin(), values.end(), dest.begin());
}

}  // namespace

std::vector<std::int16_t> readHexFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open weight file: " + path);
  }

  std::vector<std::int16_t> values;
  std::string line;
  std::size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    const auto comment = line.find("//");
    if (comment != std::string::npos) {
      line.erase(comment);
    }
    const std::string token = trim(line);
    if (token.empty()) {
      continue;
    }

    const bool hex = token.size() <= 4 &&
                     std::all_of(token.begin(), token.end(), [](unsigned char c) {
                       return std::isxdigit(c);
                     });
    if (!hex) {
      throw std::runtime_error(path + ":" + std::to_string(line_no) +
                               ": not a 16-bit hex value: '" + token + "'");
    }

    const auto raw = static_cast<std::uint16_t>(std::stoul(token, nullptr, 16));
    values.push_back(static_cast<std::int16_t>(raw));
  }

  return values;
}

ModelWeights loadModelWeights(const std::string& directory) {
  std::string base = directory;
  if (!base.empty() && base.back() != '/') {
    base += '/';
  }

  ModelWeights weights;
  loadInto(weights.w1, base + "w1.hex");
  loadInto(weights.b1, base + "b1.hex");
  loadInto(weights.w2, base + "w2.hex");
  loadInto(weights.b2, base + "b2.hex");
  return weights;
}

}  // namespace nanotrade
