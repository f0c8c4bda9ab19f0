#pragma once

#include <functional>
#include <string>

#include "strata/core/image.hpp"

namespace strata::core {

enum class LayerKind {
  kBackground,
  kOverlay,
  kText,
  kCaption,
};

inline const char* LayerKindName(LayerKind kind) {
  switch (kind) {
    case LayerKind::kBackground:
      return "background";
    case LayerKind::kOverlay:
      return "overlay";
    case LayerKind::kText:
      return "text";
    case LayerKind::kCaption:
      return "caption";
  }
  return "unknown";
}

// Renders local time t into an image already sized to the layer region. Must not depend on any
// other frame having been rendered and must be safe to call from several threads at once.
using LayerRenderFn = std::function<void(double t, Image* out)>;

struct Layer {
  std::string name;
  LayerKind kind = LayerKind::kOverlay;
  int z_index = 0;
  double start_seconds = 0.0;
  double duration_seconds = 0.0;
  double opacity = 1.0;
  Rect region;
  LayerRenderFn render;

  bool IsActive(double t) const { return start_seconds <= t && t < start_seconds + duration_seconds; }
};

}  // namespace strata::core
