#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "strata/core/errors.hpp"
#include "strata/core/image.hpp"
#include "strata/core/layer.hpp"
#include "strata/core/render_context.hpp"
#include "strata/text/text_raster.hpp"

namespace strata::core {

struct CanvasSize {
  int width = 1080;
  int height = 1920;

  Rect Full() const { return Rect{0, 0, width, height}; }
  // Layout constants are authored for a 1080x1920 canvas.
  double ScaleX() const { return static_cast<double>(width) / 1080.0; }
  double ScaleY() const { return static_cast<double>(height) / 1920.0; }
};

struct TimeWindow {
  double start_seconds = 0.0;
  double duration_seconds = 0.0;
};

// Backgrounds are opaque and cover the whole canvas for every t.
Layer MakeClassicBackground(const CanvasSize& canvas, const TimeWindow& window, double track_duration);
Layer MakeEnergyBackground(const CanvasSize& canvas, const TimeWindow& window);
Layer MakeGradientBackground(const CanvasSize& canvas, const TimeWindow& window, double track_duration);

struct BeatPulseOptions {
  double window_seconds = 0.10;
  double max_alpha = 0.35;
  Rgb tint{255, 255, 255};
};

// (1 - d / window)^2 for the distance d to the nearest beat, 0 beyond the window or with no beats.
double BeatPulseIntensity(const std::vector<double>& beat_times, double t, double window_seconds);
// 1 / (1 + 10 d); 0 with no beats.
double BeatRingIntensity(const std::vector<double>& beat_times, double t);

Layer MakeBeatPulseLayer(const CanvasSize& canvas, const TimeWindow& window, std::vector<double> beat_times,
                         const BeatPulseOptions& options);
Layer MakeBeatRingLayer(const CanvasSize& canvas, const TimeWindow& window, std::vector<double> beat_times);

enum class ParticleMode {
  kBurst,
  kDrift,
};

struct ParticleOptions {
  ParticleMode mode = ParticleMode::kBurst;
  int count = 200;
  double min_lifetime_seconds = 0.5;
  double max_lifetime_seconds = 2.0;
  double max_speed = 200.0;
  double gravity = 50.0;
  double radius_per_second = 10.0;
  int max_radius = 20;
};

// Particle brightness follows the loudness envelope at t; positions depend only on the seed and t.
Layer MakeParticleLayer(const CanvasSize& canvas, const TimeWindow& window, const ParticleOptions& options,
                        uint64_t seed, std::vector<double> loudness_envelope, double track_duration);

// Bar fill reads the loudness envelope at t.
Layer MakeWaveformLayer(const CanvasSize& canvas, const TimeWindow& window, std::vector<double> loudness_envelope,
                        double track_duration);
// Bar heights come from a fixed oscillator bank driven by t alone, not from the audio.
Layer MakeSpectrumBarsLayer(const CanvasSize& canvas, const TimeWindow& window);
Layer MakeProgressBarLayer(const CanvasSize& canvas, const TimeWindow& window, double track_duration);

struct TextLayerSpec {
  std::string name;
  LayerKind kind = LayerKind::kText;
  int z_index = 50;
  Rect region;
  float pixel_height = 68.0F;
  size_t max_chars = 220;
  text::TextStyle style;
};

// Empty text yields a zero-duration layer and a layer-input-missing warning. Without a font the
// layer keeps its timing but renders transparent.
Layer MakeStaticTextLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                          RenderContext* context, std::vector<RenderWarning>* warnings);
Layer MakeTypewriterLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                          RenderContext* context, std::vector<RenderWarning>* warnings);
// Splits the text into sentence chunks shown one after another, each for an equal share of the window.
Layer MakeCaptionLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                       RenderContext* context, std::vector<RenderWarning>* warnings);

size_t CaptionChunkIndex(size_t chunk_count, double local_seconds, double window_seconds);

// 1 + 0.3 |sin(4 pi t)| for the time into the window: two swells a second.
double PulseScale(double local_seconds);

// The text is rasterized once; each frame samples it scaled by PulseScale about the region center.
Layer MakePulsingTextLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                           RenderContext* context, std::vector<RenderWarning>* warnings);

enum class SlideDirection {
  kFromLeft,
  kFromRight,
  kFromBottom,
};

// How far along its slide a block is, eased out from 0 to 1 over the slide-in time.
constexpr double kSlideInSeconds = 0.8;
double SlideProgress(double local_seconds, double window_seconds);

struct PixelOffset {
  int dx = 0;
  int dy = 0;
};

// Starts one region width (or height) outside the region and lands at zero, where it holds.
PixelOffset SlideOffset(SlideDirection direction, double local_seconds, double window_seconds, int width, int height);

Layer MakeSlidingTextLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                           SlideDirection direction, RenderContext* context, std::vector<RenderWarning>* warnings);

}  // namespace strata::core
