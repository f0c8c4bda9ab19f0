#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

namespace strata::core {

// Tolerance for products like 30.0 * 30.0 that land a hair above an integer.
constexpr double kFrameCountTolerance = 1e-9;

inline int64_t FrameCount(double duration_seconds, int fps) {
  if (fps <= 0) {
    throw std::invalid_argument("Frame rate must be positive.");
  }
  if (!(duration_seconds > 0.0) || !std::isfinite(duration_seconds)) {
    return 0;
  }
  const double exact = duration_seconds * static_cast<double>(fps);
  return static_cast<int64_t>(std::ceil(exact - kFrameCountTolerance));
}

inline double FrameTimestamp(int64_t frame_index, int fps) {
  return static_cast<double>(frame_index) / static_cast<double>(fps);
}

inline size_t EnvelopeIndex(double t, double duration_seconds, size_t envelope_size) {
  if (envelope_size == 0U || !(duration_seconds > 0.0)) {
    return 0U;
  }
  const double position = std::floor(t / duration_seconds * static_cast<double>(envelope_size));
  if (!(position > 0.0)) {
    return 0U;
  }
  return std::min(static_cast<size_t>(position), envelope_size - 1U);
}

inline double EnvelopeAt(const std::vector<double>& envelope, double t, double duration_seconds) {
  if (envelope.empty()) {
    return 0.0;
  }
  return envelope[EnvelopeIndex(t, duration_seconds, envelope.size())];
}

// Distance in seconds from t to the closest entry of a sorted time list, or +inf when empty.
inline double DistanceToNearest(const std::vector<double>& sorted_times, double t) {
  if (sorted_times.empty()) {
    return std::numeric_limits<double>::infinity();
  }
  const auto it = std::lower_bound(sorted_times.begin(), sorted_times.end(), t);
  double best = std::numeric_limits<double>::infinity();
  if (it != sorted_times.end()) {
    best = std::fabs(*it - t);
  }
  if (it != sorted_times.begin()) {
    best = std::min(best, std::fabs(t - *(it - 1)));
  }
  return best;
}

inline uint64_t SecondsToSamples(double seconds, int sample_rate) {
  if (seconds <= 0.0 || sample_rate <= 0) {
    return 0U;
  }
  return static_cast<uint64_t>(std::llround(seconds * static_cast<double>(sample_rate)));
}

}  // namespace strata::core
