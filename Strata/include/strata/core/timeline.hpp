#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace strata::core {

enum class SegmentId {
  kIntro = 0,
  kHookMoment = 1,
  kDevelopment = 2,
  kClimax = 3,
  kClosing = 4,
};

constexpr size_t kSegmentCount = 5;

struct Segment {
  SegmentId id = SegmentId::kIntro;
  double start_seconds = 0.0;
  double end_seconds = 0.0;

  double Duration() const { return end_seconds - start_seconds; }
};

struct Timeline {
  double duration_seconds = 0.0;
  std::array<Segment, kSegmentCount> segments{};

  const Segment& Get(SegmentId id) const { return segments[static_cast<size_t>(id)]; }
};

const char* SegmentName(SegmentId id);
const std::array<double, kSegmentCount>& SegmentProportions();

// Throws InvalidAudioError when duration is not a positive finite number.
Timeline SegmentTimeline(double duration_seconds);

}  // namespace strata::core
