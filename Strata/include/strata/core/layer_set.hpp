#pragma once

#include <vector>

#include "strata/core/audio_features.hpp"
#include "strata/core/concept.hpp"
#include "strata/core/errors.hpp"
#include "strata/core/layer.hpp"
#include "strata/core/render_config.hpp"
#include "strata/core/render_context.hpp"
#include "strata/core/timeline.hpp"

namespace strata::core {

constexpr double kTitleRevealSeconds = 2.8;

// Instantiates the synthesizers of the configured style. Enhanced effects add layers on top of the
// style's base set without changing the base layers.
std::vector<Layer> BuildLayerSet(const Concept& reel, const AudioAnalysis& analysis, const Timeline& timeline,
                                 const RenderConfig& config, RenderContext* context,
                                 std::vector<RenderWarning>* warnings);

}  // namespace strata::core
