#pragma once

#include <cstdint>
#include <string_view>

namespace strata::core {

// FNV-1a over the bytes of `text`.
inline uint64_t Hash64(std::string_view text, uint64_t basis = 1469598103934665603ULL) {
  for (const char c : text) {
    basis = (basis ^ static_cast<uint64_t>(static_cast<unsigned char>(c))) * 1099511628211ULL;
  }
  return basis;
}

// splitmix64 finalizer over a boost-style combine.
inline uint64_t Hash64Combine(uint64_t a, uint64_t b) {
  uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6U) + (b >> 2U);
  z = (z ^ (z >> 30U)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27U)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31U);
}

// Stable per-layer stream: the job seed mixed with the layer name and up to two integer keys.
inline uint64_t LayerSeed(uint64_t job_seed, std::string_view layer_name, uint64_t key_a = 0U, uint64_t key_b = 0U) {
  return Hash64Combine(Hash64Combine(Hash64Combine(job_seed, Hash64(layer_name)), key_a), key_b);
}

// PCG-XSH-RR 64/32 with a fixed stream. Cheap to construct, so synthesizers build one per
// (layer, key) instead of sharing generator state between frames.
class PCG32 {
 public:
  explicit PCG32(uint64_t seed) {
    Step();
    state_ += seed;
    Step();
  }

  uint32_t NextUInt() {
    const uint64_t x = state_;
    Step();
    const auto shifted = static_cast<uint32_t>(((x >> 18U) ^ x) >> 27U);
    const auto rot = static_cast<uint32_t>(x >> 59U);
    return (shifted >> rot) | (shifted << ((32U - rot) & 31U));
  }

  // [0, 1)
  double NextUnit() { return static_cast<double>(NextUInt()) * (1.0 / 4294967296.0); }

  double Uniform(double lo, double hi) { return lo + (hi - lo) * NextUnit(); }

  // Inclusive on both ends.
  int UniformInt(int lo, int hi) {
    if (hi <= lo) {
      return lo;
    }
    return lo + static_cast<int>(NextUInt() % (static_cast<uint32_t>(hi - lo) + 1U));
  }

 private:
  static constexpr uint64_t kMultiplier = 6364136223846793005ULL;
  static constexpr uint64_t kIncrement = 1442695040888963407ULL;

  void Step() { state_ = state_ * kMultiplier + kIncrement; }

  uint64_t state_ = 0U;
};

}  // namespace strata::core
