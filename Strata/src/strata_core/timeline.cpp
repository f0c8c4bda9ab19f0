#include "strata/core/timeline.hpp"

#include <cmath>
#include <sstream>

#include "strata/core/errors.hpp"

namespace strata::core {

const char* SegmentName(SegmentId id) {
  switch (id) {
    case SegmentId::kIntro:
      return "intro";
    case SegmentId::kHookMoment:
      return "hook_moment";
    case SegmentId::kDevelopment:
      return "development";
    case SegmentId::kClimax:
      return "climax";
    case SegmentId::kClosing:
      return "closing";
  }
  return "unknown";
}

const std::array<double, kSegmentCount>& SegmentProportions() {
  static const std::array<double, kSegmentCount> proportions = {0.1, 0.1, 0.5, 0.2, 0.1};
  return proportions;
}

Timeline SegmentTimeline(double duration_seconds) {
  if (!std::isfinite(duration_seconds) || duration_seconds <= 0.0) {
    std::ostringstream message;
    message << "Audio duration must be positive, got " << duration_seconds << " seconds.";
    throw InvalidAudioError(message.str());
  }

  Timeline timeline;
  timeline.duration_seconds = duration_seconds;
  const auto& proportions = SegmentProportions();
  double cumulative = 0.0;
  double cursor = 0.0;
  for (size_t i = 0; i < kSegmentCount; ++i) {
    cumulative += proportions[i];
    Segment& segment = timeline.segments[i];
    segment.id = static_cast<SegmentId>(i);
    segment.start_seconds = cursor;
    segment.end_seconds = i + 1 == kSegmentCount ? duration_seconds : duration_seconds * cumulative;
    cursor = segment.end_seconds;
  }
  return timeline;
}

}  // namespace strata::core
