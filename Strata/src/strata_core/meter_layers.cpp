#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

#include "strata/core/synthesizers.hpp"
#include "strata/core/timebase.hpp"

namespace strata::core {
namespace {

constexpr int kSpectrumBarCount = 20;
constexpr uint8_t kTrackAlpha = 48;

int Scaled(double value, double scale) { return std::max(1, static_cast<int>(std::lround(value * scale))); }

}  // namespace

Layer MakeWaveformLayer(const CanvasSize& canvas, const TimeWindow& window, std::vector<double> loudness_envelope,
                        double track_duration) {
  Layer layer;
  layer.name = "overlay.waveform";
  layer.kind = LayerKind::kOverlay;
  layer.z_index = 30;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  const int bar_width = static_cast<int>(std::lround(static_cast<double>(canvas.width) * 0.9));
  layer.region = Rect{(canvas.width - bar_width) / 2, static_cast<int>(std::lround(canvas.height * 0.78)), bar_width,
                      Scaled(140.0, canvas.ScaleY())};

  auto envelope = std::make_shared<const std::vector<double>>(std::move(loudness_envelope));
  layer.render = [envelope, track_duration](double t, Image* out) {
    out->Fill(Rgb{255, 255, 255}, kTrackAlpha);
    const double level = EnvelopeAt(*envelope, t, track_duration);
    const int filled = static_cast<int>(std::lround(static_cast<double>(out->width) * std::max(0.0, std::min(level, 1.0))));
    FillRect(out, Rect{0, 0, filled, out->height}, Rgb{200, 200, 255}, 255U);
  };
  return layer;
}

Layer MakeSpectrumBarsLayer(const CanvasSize& canvas, const TimeWindow& window) {
  Layer layer;
  layer.name = "overlay.spectrum_bars";
  layer.kind = LayerKind::kOverlay;
  layer.z_index = 30;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  layer.opacity = 0.85;
  const int height = Scaled(200.0, canvas.ScaleY());
  layer.region = Rect{0, canvas.height - height, canvas.width, height};

  layer.render = [](double t, Image* out) {
    out->Clear();
    const int slot = std::max(1, out->width / kSpectrumBarCount);
    const int gap = std::max(1, slot / 8);
    for (int i = 0; i < kSpectrumBarCount; ++i) {
      const double level = std::fabs(std::sin(t * static_cast<double>(i + 1) * 2.0 + 0.5 * static_cast<double>(i))) * 0.8 + 0.2;
      const int bar_height = static_cast<int>(std::lround(level * static_cast<double>(out->height)));
      const Rgb color = LerpRgb(Rgb{255, 64, 160}, Rgb{64, 220, 255},
                                static_cast<double>(i) / static_cast<double>(kSpectrumBarCount - 1));
      FillRect(out, Rect{i * slot + gap / 2, out->height - bar_height, slot - gap, bar_height}, color, 255U);
    }
  };
  return layer;
}

Layer MakeProgressBarLayer(const CanvasSize& canvas, const TimeWindow& window, double track_duration) {
  Layer layer;
  layer.name = "overlay.progress";
  layer.kind = LayerKind::kOverlay;
  layer.z_index = 35;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  const int bar_width = static_cast<int>(std::lround(static_cast<double>(canvas.width) * 0.8));
  layer.region = Rect{(canvas.width - bar_width) / 2, static_cast<int>(std::lround(canvas.height * 0.04)), bar_width,
                      Scaled(12.0, canvas.ScaleY())};

  const double period = track_duration > 0.0 ? track_duration : 1.0;
  layer.render = [period](double t, Image* out) {
    out->Fill(Rgb{255, 255, 255}, kTrackAlpha);
    const double progress = std::max(0.0, std::min(t / period, 1.0));
    const int filled = static_cast<int>(std::lround(static_cast<double>(out->width) * progress));
    FillRect(out, Rect{0, 0, filled, out->height}, Rgb{255, 255, 255}, 230U);
  };
  return layer;
}

}  // namespace strata::core
