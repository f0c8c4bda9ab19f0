#pragma once

#include <optional>
#include <string>
#include <vector>

#include "strata/core/timeline.hpp"

namespace strata::core {

struct StoryBeats {
  std::optional<std::string> intro;
  std::optional<std::string> hook_moment;
  std::optional<std::string> development;
  std::optional<std::string> climax;
  std::optional<std::string> closing;

  const std::optional<std::string>& Get(SegmentId id) const {
    switch (id) {
      case SegmentId::kIntro:
        return intro;
      case SegmentId::kHookMoment:
        return hook_moment;
      case SegmentId::kDevelopment:
        return development;
      case SegmentId::kClimax:
        return climax;
      case SegmentId::kClosing:
        return closing;
    }
    return intro;
  }
};

struct Concept {
  std::string title;
  StoryBeats story;
  std::vector<std::string> hashtags;
  std::string transcription;
};

}  // namespace strata::core
