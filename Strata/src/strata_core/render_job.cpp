#include "strata/core/render_job.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "strata/core/layer_set.hpp"
#include "strata/core/render_context.hpp"
#include "strata/core/timebase.hpp"
#include "strata/text/font.hpp"

namespace strata::core {
namespace {

std::shared_ptr<const text::FontFace> LoadConfiguredFont(const RenderConfig& config,
                                                        std::vector<RenderWarning>* warnings) {
  if (!config.font_path.has_value()) {
    return nullptr;
  }
  auto face = std::make_shared<text::FontFace>();
  std::string error;
  if (!face->LoadFromFile(*config.font_path, &error)) {
    AddWarning(warnings, WarningKind::kResourceMissing, error);
    return nullptr;
  }
  return face;
}

}  // namespace

Compositor AssembleCompositor(const AudioAnalysis& analysis, const Concept& reel, const RenderConfig& config,
                              std::vector<RenderWarning>* warnings) {
  Compositor compositor(config.width, config.height, config.fps);
  const Timeline timeline = SegmentTimeline(analysis.duration_seconds);
  compositor.SetAnalysis(analysis);
  compositor.SetTimeline(timeline);

  text::FontCache fonts(LoadConfiguredFont(config, warnings));
  RenderContext context;
  context.seed = config.seed;
  context.fonts = &fonts;
  for (Layer& layer : BuildLayerSet(reel, analysis, timeline, config, &context, warnings)) {
    compositor.AddLayer(std::move(layer));
  }
  compositor.BeginRendering();
  return compositor;
}

ReelRenderResult ReelRenderer::Render(const AudioBuffer& audio, int sample_rate, const Concept& reel,
                                      const FrameSink& sink, const ReelRenderOptions& options) const {
  std::vector<RenderWarning> warnings;
  const AudioAnalysis analysis = AnalyzeAudio(audio, sample_rate, options.features, &warnings);
  ReelRenderResult result = RenderAnalysis(analysis, reel, sink, options);
  result.warnings.insert(result.warnings.begin(), warnings.begin(), warnings.end());
  return result;
}

ReelRenderResult ReelRenderer::RenderAnalysis(const AudioAnalysis& analysis, const Concept& reel,
                                              const FrameSink& sink, const ReelRenderOptions& options) const {
  ReelRenderResult result;
  Compositor compositor = AssembleCompositor(analysis, reel, options.config, &result.warnings);
  result.analysis = compositor.analysis();
  result.timeline = compositor.timeline();
  for (const Layer& layer : compositor.layers()) {
    result.layers.push_back(
        {layer.name, layer.kind, layer.z_index, layer.start_seconds, layer.duration_seconds, layer.opacity});
  }

  if (options.snapshot_seconds.has_value() && compositor.FrameCount() > 0) {
    const int64_t last = compositor.FrameCount() - 1;
    const int64_t index = std::max<int64_t>(
        0, std::min<int64_t>(last, static_cast<int64_t>(*options.snapshot_seconds * options.config.fps)));
    Frame snapshot;
    Image scratch;
    compositor.ComposeFrame(index, &snapshot, &scratch);
    result.snapshot = std::move(snapshot);
  }

  FrameLoopOptions loop;
  loop.max_parallel_jobs = options.config.max_parallel_jobs;
  loop.progress_callback = options.progress_callback;
  loop.cancel_requested = options.cancel_requested;
  FrameLoopResult loop_result;
  std::string error;
  if (!compositor.Run(sink, loop, &loop_result, &error)) {
    throw EncodingError("Frame sink rejected frame " + std::to_string(loop_result.frames_written) + ": " + error);
  }
  result.frames_total = loop_result.frames_total;
  result.frames_written = loop_result.frames_written;
  result.cancelled = loop_result.cancelled;
  return result;
}

}  // namespace strata::core
