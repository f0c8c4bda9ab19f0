#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "strata/core/synthesizers.hpp"
#include "strata/core/timebase.hpp"

namespace strata::core {
namespace {

constexpr double kRingIntensityFloor = 0.05;
constexpr int kRingCount = 3;

struct RingGeometry {
  int size = 0;
  double scale = 1.0;
  std::vector<float> distance;
};

}  // namespace

double BeatPulseIntensity(const std::vector<double>& beat_times, double t, double window_seconds) {
  if (beat_times.empty() || !(window_seconds > 0.0)) {
    return 0.0;
  }
  const double d = DistanceToNearest(beat_times, t);
  if (d >= window_seconds) {
    return 0.0;
  }
  const double falloff = 1.0 - d / window_seconds;
  return falloff * falloff;
}

double BeatRingIntensity(const std::vector<double>& beat_times, double t) {
  if (beat_times.empty()) {
    return 0.0;
  }
  return 1.0 / (1.0 + DistanceToNearest(beat_times, t) * 10.0);
}

Layer MakeBeatPulseLayer(const CanvasSize& canvas, const TimeWindow& window, std::vector<double> beat_times,
                         const BeatPulseOptions& options) {
  Layer layer;
  layer.name = "overlay.beat_pulse";
  layer.kind = LayerKind::kOverlay;
  layer.z_index = 10;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  layer.region = canvas.Full();

  auto beats = std::make_shared<const std::vector<double>>(std::move(beat_times));
  layer.render = [beats, options](double t, Image* out) {
    const double intensity = BeatPulseIntensity(*beats, t, options.window_seconds);
    out->Fill(options.tint, UnitToByte(intensity * options.max_alpha));
  };
  return layer;
}

Layer MakeBeatRingLayer(const CanvasSize& canvas, const TimeWindow& window, std::vector<double> beat_times) {
  auto geometry = std::make_shared<RingGeometry>();
  geometry->scale = canvas.ScaleX();
  const double max_radius = 300.0 * geometry->scale * (1.0 + 0.5 * static_cast<double>(kRingCount)) + 8.0;
  geometry->size = std::max(1, static_cast<int>(std::ceil(2.0 * max_radius)));
  geometry->distance.resize(static_cast<size_t>(geometry->size) * static_cast<size_t>(geometry->size));
  const double center = static_cast<double>(geometry->size) * 0.5;
  for (int y = 0; y < geometry->size; ++y) {
    for (int x = 0; x < geometry->size; ++x) {
      geometry->distance[static_cast<size_t>(y) * static_cast<size_t>(geometry->size) + static_cast<size_t>(x)] =
          static_cast<float>(std::hypot(static_cast<double>(x) + 0.5 - center, static_cast<double>(y) + 0.5 - center));
    }
  }

  Layer layer;
  layer.name = "overlay.beat_rings";
  layer.kind = LayerKind::kOverlay;
  layer.z_index = 15;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  layer.opacity = 0.8;
  layer.region = Rect{canvas.width / 2 - geometry->size / 2, canvas.height / 2 - geometry->size / 2, geometry->size,
                      geometry->size};

  auto beats = std::make_shared<const std::vector<double>>(std::move(beat_times));
  layer.render = [beats, geometry](double t, Image* out) {
    out->Clear();
    const double intensity = BeatRingIntensity(*beats, t);
    if (intensity < kRingIntensityFloor) {
      return;
    }
    const double disc_radius = 300.0 * geometry->scale * intensity;
    const double thickness = 8.0 * geometry->scale;
    const Rgb disc_color{255, static_cast<uint8_t>(std::lround(200.0 * intensity)),
                         static_cast<uint8_t>(std::lround(100.0 * intensity))};
    const Rgb ring_color{255, 255, 255};

    for (size_t i = 0; i < geometry->distance.size(); ++i) {
      const double d = static_cast<double>(geometry->distance[i]);
      double alpha = 0.0;
      Rgb color = disc_color;
      if (d <= disc_radius) {
        alpha = intensity * std::min(1.0, disc_radius - d + 0.5);
      } else {
        for (int k = 1; k <= kRingCount; ++k) {
          const double ring_radius = disc_radius * (1.0 + 0.5 * static_cast<double>(k));
          const double edge = thickness * 0.5 - std::fabs(d - ring_radius);
          if (edge > -0.5) {
            alpha = intensity * std::min(1.0, edge + 0.5) / static_cast<double>(k);
            color = ring_color;
            break;
          }
        }
      }
      if (alpha <= 0.0) {
        continue;
      }
      uint8_t* px = out->rgba.data() + i * 4U;
      px[0] = color.r;
      px[1] = color.g;
      px[2] = color.b;
      px[3] = UnitToByte(alpha);
    }
  };
  return layer;
}

}  // namespace strata::core
