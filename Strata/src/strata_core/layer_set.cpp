#include "strata/core/layer_set.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "strata/core/synthesizers.hpp"
#include "strata/text/text_layout.hpp"

namespace strata::core {
namespace {

Rect CenteredBand(const CanvasSize& canvas, double y_fraction, double design_height) {
  const int width = static_cast<int>(std::lround(static_cast<double>(canvas.width) * 0.9));
  const int height = std::max(1, static_cast<int>(std::lround(design_height * canvas.ScaleY())));
  return Rect{(canvas.width - width) / 2, static_cast<int>(std::lround(static_cast<double>(canvas.height) * y_fraction)),
              width, height};
}

TextLayerSpec MakeTextSpec(const CanvasSize& canvas, std::string name, int z_index, double y_fraction,
                           double design_height, float design_pixel_height, size_t max_chars, Rgb fill) {
  TextLayerSpec spec;
  spec.name = std::move(name);
  spec.z_index = z_index;
  spec.region = CenteredBand(canvas, y_fraction, design_height);
  spec.pixel_height = std::max(8.0F, design_pixel_height * static_cast<float>(canvas.ScaleX()));
  spec.max_chars = max_chars;
  spec.style.fill = fill;
  spec.style.side_padding = std::max(4, static_cast<int>(std::lround(20.0 * canvas.ScaleX())));
  spec.style.stroke_width = std::max(1, static_cast<int>(std::lround(2.0 * canvas.ScaleX())));
  spec.style.line_spacing = std::max(2, static_cast<int>(std::lround(8.0 * canvas.ScaleY())));
  return spec;
}

bool ConceptHasText(const Concept& reel, const RenderConfig& config) {
  if (!reel.title.empty() || !config.fallback_title.empty() || !reel.hashtags.empty()) {
    return true;
  }
  for (size_t i = 0; i < kSegmentCount; ++i) {
    const auto& beat = reel.story.Get(static_cast<SegmentId>(i));
    if (beat.has_value() && !beat->empty()) {
      return true;
    }
  }
  return config.enhanced_effects && !reel.transcription.empty();
}

// The gradient style animates its story beats: the hook and the climax pulse, the development
// slides in from the left.
Layer MakeStoryLayer(VisualStyle style, SegmentId id, const TextLayerSpec& spec, const TimeWindow& window,
                     const std::string& text, RenderContext* context, std::vector<RenderWarning>* warnings) {
  if (style == VisualStyle::kGradient) {
    switch (id) {
      case SegmentId::kHookMoment:
      case SegmentId::kClimax:
        return MakePulsingTextLayer(spec, window, text, context, warnings);
      case SegmentId::kDevelopment:
        return MakeSlidingTextLayer(spec, window, text, SlideDirection::kFromLeft, context, warnings);
      case SegmentId::kIntro:
      case SegmentId::kClosing:
        break;
    }
  }
  return MakeStaticTextLayer(spec, window, text, context, warnings);
}

void AddStyleLayers(const AudioAnalysis& analysis, const RenderConfig& config, const CanvasSize& canvas,
                    const TimeWindow& full, uint64_t seed, std::vector<Layer>* layers) {
  const double duration = analysis.duration_seconds;
  switch (config.style) {
    case VisualStyle::kClassic:
      layers->push_back(MakeClassicBackground(canvas, full, duration));
      layers->push_back(MakeBeatPulseLayer(canvas, full, analysis.beat_times, BeatPulseOptions{}));
      break;
    case VisualStyle::kEnergy: {
      layers->push_back(MakeEnergyBackground(canvas, full));
      layers->push_back(MakeBeatRingLayer(canvas, full, analysis.beat_times));
      layers->push_back(MakeBeatPulseLayer(canvas, full, analysis.beat_times, BeatPulseOptions{}));
      ParticleOptions particles;
      particles.mode = ParticleMode::kBurst;
      layers->push_back(MakeParticleLayer(canvas, full, particles, seed, analysis.loudness_envelope, duration));
      break;
    }
    case VisualStyle::kGradient:
      layers->push_back(MakeGradientBackground(canvas, full, duration));
      layers->push_back(MakeBeatPulseLayer(canvas, full, analysis.beat_times, BeatPulseOptions{}));
      layers->push_back(MakeSpectrumBarsLayer(canvas, full));
      layers->push_back(MakeProgressBarLayer(canvas, full, duration));
      break;
  }

  if (!config.enhanced_effects) {
    return;
  }
  layers->push_back(MakeWaveformLayer(canvas, full, analysis.loudness_envelope, duration));
  if (config.style == VisualStyle::kGradient) {
    ParticleOptions drift;
    drift.mode = ParticleMode::kDrift;
    drift.count = 50;
    layers->push_back(MakeParticleLayer(canvas, full, drift, seed, analysis.loudness_envelope, duration));
  }
}

}  // namespace

std::vector<Layer> BuildLayerSet(const Concept& reel, const AudioAnalysis& analysis, const Timeline& timeline,
                                 const RenderConfig& config, RenderContext* context,
                                 std::vector<RenderWarning>* warnings) {
  const CanvasSize canvas{config.width, config.height};
  const double duration = analysis.duration_seconds;
  const TimeWindow full{0.0, duration};
  const uint64_t seed = context != nullptr ? context->seed : config.seed;

  std::vector<Layer> layers;
  AddStyleLayers(analysis, config, canvas, full, seed, &layers);

  const bool has_font = context != nullptr && context->fonts != nullptr && context->fonts->HasFont();
  if (!has_font && ConceptHasText(reel, config)) {
    AddWarning(warnings, WarningKind::kResourceMissing, "no font configured; text layers render transparent");
  }

  const TimeWindow title_window{0.0, std::min(kTitleRevealSeconds, duration)};
  const TextLayerSpec title_spec =
      MakeTextSpec(canvas, "text.title", 50, 0.18, 280.0, 80.0F, text::kTitleTextLimit, Rgb{255, 240, 200});
  if (reel.title.empty() && !config.fallback_title.empty()) {
    layers.push_back(MakeStaticTextLayer(title_spec, title_window, config.fallback_title, context, warnings));
  } else {
    layers.push_back(MakeTypewriterLayer(title_spec, title_window, reel.title, context, warnings));
  }

  for (size_t i = 0; i < kSegmentCount; ++i) {
    const Segment& segment = timeline.segments[i];
    const double y_fraction = segment.id == SegmentId::kIntro ? 0.40 : 0.12;
    const TextLayerSpec spec = MakeTextSpec(canvas, std::string("text.story.") + SegmentName(segment.id), 51,
                                            y_fraction, 300.0, 68.0F, text::kDefaultTextLimit, Rgb{255, 255, 255});
    const auto& beat = reel.story.Get(segment.id);
    layers.push_back(MakeStoryLayer(config.style, segment.id, spec, TimeWindow{segment.start_seconds, segment.Duration()},
                                    beat.value_or(std::string()), context, warnings));
  }

  const TextLayerSpec hashtag_spec =
      MakeTextSpec(canvas, "text.hashtags", 60, 0.92, 160.0, 44.0F, text::kDefaultTextLimit, Rgb{255, 255, 255});
  const std::string hashtags = text::FormatHashtags(reel.hashtags, text::kMaxHashtags);
  if (config.style == VisualStyle::kGradient) {
    layers.push_back(
        MakeSlidingTextLayer(hashtag_spec, full, hashtags, SlideDirection::kFromBottom, context, warnings));
  } else {
    layers.push_back(MakeStaticTextLayer(hashtag_spec, full, hashtags, context, warnings));
  }

  if (config.enhanced_effects) {
    TextLayerSpec caption_spec =
        MakeTextSpec(canvas, "caption.transcript", 70, 0.66, 200.0, 56.0F, text::kCaptionTextLimit, Rgb{255, 235, 140});
    caption_spec.kind = LayerKind::kCaption;
    layers.push_back(MakeCaptionLayer(caption_spec, full, reel.transcription, context, warnings));
  }
  return layers;
}

}  // namespace strata::core
