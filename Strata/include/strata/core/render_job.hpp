#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "strata/core/audio_features.hpp"
#include "strata/core/compositor.hpp"
#include "strata/core/concept.hpp"
#include "strata/core/errors.hpp"
#include "strata/core/render_config.hpp"
#include "strata/core/timeline.hpp"

namespace strata::core {

struct ReelRenderOptions {
  RenderConfig config;
  FeatureOptions features;
  std::function<void(double)> progress_callback;
  std::function<bool()> cancel_requested;
  // When set, the frame at this time is composed once more and returned in the result.
  std::optional<double> snapshot_seconds;
};

struct LayerSummary {
  std::string name;
  LayerKind kind = LayerKind::kOverlay;
  int z_index = 0;
  double start_seconds = 0.0;
  double duration_seconds = 0.0;
  double opacity = 1.0;
};

struct ReelRenderResult {
  AudioAnalysis analysis;
  Timeline timeline;
  std::vector<LayerSummary> layers;
  int64_t frames_total = 0;
  int64_t frames_written = 0;
  bool cancelled = false;
  std::optional<Frame> snapshot;
  std::vector<RenderWarning> warnings;
};

// Builds a compositor in the Rendering state: timeline, font resources and layers are all
// prepared before this returns.
Compositor AssembleCompositor(const AudioAnalysis& analysis, const Concept& reel, const RenderConfig& config,
                              std::vector<RenderWarning>* warnings);

class ReelRenderer {
 public:
  // Throws InvalidAudioError before any frame is produced when the audio is unusable, and
  // EncodingError when the sink rejects a frame.
  ReelRenderResult Render(const AudioBuffer& audio, int sample_rate, const Concept& reel, const FrameSink& sink,
                          const ReelRenderOptions& options) const;
  ReelRenderResult RenderAnalysis(const AudioAnalysis& analysis, const Concept& reel, const FrameSink& sink,
                                  const ReelRenderOptions& options) const;
};

}  // namespace strata::core
