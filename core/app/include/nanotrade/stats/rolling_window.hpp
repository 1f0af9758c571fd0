#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace nanotrade {

// -----------------------------------------------------------------------------
// RollingWindow<N>
// -----------------------------------------------------------------------------
//
// @brief  Fixed-capacity circular buffer of the last N samples with a
//         running sum.
//
// @details
// N must be a power of two so the average is a shift. sum() always equals
// the exact sum of the samples currently held: each push subtracts the
// sample it overwrites before adding the new one.
//
// Plain value type. The tick pipeline copies it to build the next state,
// so it holds no pointers and allocates nothing.
// -----------------------------------------------------------------------------
template <std::size_t N>
class RollingWindow {
  static_assert(N > 0 && (N & (N - 1)) == 0,
                "RollingWindow capacity must be a power of two");

 public:
  static constexpr std::size_t kCapacity = N;

  void push(std::uint16_t sample) {
    if (count_ == N) {
      sum_ -= samples_[head_];
    } else {
      ++count_;
    }
    samples_[head_] = sample;
    sum_ += sample;
    head_ = (head_ + 1) & (N - 1);
  }

  std::uint32_t sum() const { return sum_; }

  // Average over N, not over count(): a partly filled window reads low.
  std::uint16_t average() const {
    return static_cast<std::uint16_t>(sum_ >> shift());
  }

  std::size_t count() const { return count_; }
  bool full() const { return count_ == N; }

 private:
  static constexpr unsigned shift() {
    unsigned s = 0;
    while ((std::size_t{1} << s) < N) {
      ++s;
    }
    return s;
  }

  std::array<std::uint16_t, N> samples_{};
  std::size_t head_{0};
  std::size_t count_{0};
  std::uint32_t sum_{0};
};

}  // namespace nanotrade
