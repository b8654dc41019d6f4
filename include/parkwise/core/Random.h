#pragma once

#include "parkwise/core/Hash.h"
#include "parkwise/core/Types.h"

#include <string_view>
#include <type_traits>
#include <utility>

namespace parkwise::core {

// SplitMix64: small 64-bit state PRNG. Deterministic for a given seed, which is
// all the random policy and grid pre-fill need. Not suitable for crypto.
class SplitMix64 {
public:
  explicit SplitMix64(u64 seed = 0) : state_(seed) {}

  void reseed(u64 seed) { state_ = seed; }
  u64 state() const { return state_; }

  u64 nextU64() {
    u64 z = (state_ += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  // [0,1)
  double nextDouble() {
    constexpr double inv = 1.0 / static_cast<double>(1ull << 53);
    return static_cast<double>(nextU64() >> 11) * inv;
  }

  // Uniform index in [0, count). count must be > 0.
  std::size_t nextIndex(std::size_t count) {
    return static_cast<std::size_t>(nextU64() % static_cast<u64>(count));
  }

  // Inclusive integer range.
  template <class Int, std::enable_if_t<std::is_integral_v<Int>, int> = 0>
  Int range(Int minInclusive, Int maxInclusive) {
    if (maxInclusive < minInclusive) std::swap(minInclusive, maxInclusive);
    const u64 span = static_cast<u64>(maxInclusive) - static_cast<u64>(minInclusive) + 1ull;
    return static_cast<Int>(minInclusive + static_cast<Int>(nextU64() % span));
  }

  bool chance(double p) { return nextDouble() < p; }

private:
  u64 state_{0};
};

inline u64 seedFromText(std::string_view text) { return fnv1a64(text); }

} // namespace parkwise::core
