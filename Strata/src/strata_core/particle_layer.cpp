#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "strata/core/rng.hpp"
#include "strata/core/synthesizers.hpp"
#include "strata/core/timebase.hpp"

namespace strata::core {
namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDriftPixelsPerUnit = 30.0;

struct DiscStamp {
  int radius = 0;
  int size = 0;
  std::vector<float> coverage;
};

std::vector<DiscStamp> BuildDiscStamps(int max_radius) {
  std::vector<DiscStamp> stamps(static_cast<size_t>(std::max(0, max_radius)) + 1U);
  for (int r = 1; r <= max_radius; ++r) {
    DiscStamp& stamp = stamps[static_cast<size_t>(r)];
    stamp.radius = r;
    stamp.size = 2 * r + 1;
    stamp.coverage.assign(static_cast<size_t>(stamp.size) * static_cast<size_t>(stamp.size), 0.0F);
    for (int y = 0; y < stamp.size; ++y) {
      for (int x = 0; x < stamp.size; ++x) {
        const double d = std::hypot(static_cast<double>(x - r), static_cast<double>(y - r));
        const double c = std::max(0.0, std::min(1.0, static_cast<double>(r) + 0.5 - d));
        stamp.coverage[static_cast<size_t>(y) * static_cast<size_t>(stamp.size) + static_cast<size_t>(x)] =
            static_cast<float>(c);
      }
    }
  }
  return stamps;
}

struct ParticleField {
  CanvasSize canvas;
  ParticleOptions options;
  uint64_t seed = 0;
  double start_seconds = 0.0;
  double track_duration = 0.0;
  double scale = 1.0;
  std::vector<double> envelope;
  std::vector<DiscStamp> stamps;
};

struct ParticleSample {
  double x = 0.0;
  double y = 0.0;
  int radius = 0;
  double alpha = 0.0;
  Rgb color;
};

double PositiveModulo(double value, double period) {
  const double m = std::fmod(value, period);
  return m < 0.0 ? m + period : m;
}

// Closed-form particle state: the lifetime and phase come from the particle index, the spawn
// state from (index, respawn cycle), so any t can be evaluated without history.
bool SampleBurstParticle(const ParticleField& field, int index, double local_t, double brightness,
                         ParticleSample* out) {
  const ParticleOptions& o = field.options;
  PCG32 base(LayerSeed(field.seed, "particles.burst", static_cast<uint64_t>(index)));
  const double lifetime = base.Uniform(o.min_lifetime_seconds, std::max(o.min_lifetime_seconds, o.max_lifetime_seconds));
  if (!(lifetime > 0.0)) {
    return false;
  }
  const double phase = local_t + base.Uniform(0.0, lifetime);
  const double cycle = std::floor(phase / lifetime);
  const double age = phase - cycle * lifetime;

  PCG32 spawn(LayerSeed(field.seed, "particles.burst", static_cast<uint64_t>(index),
                        static_cast<uint64_t>(static_cast<int64_t>(cycle)) + 1U));
  const double x0 = spawn.Uniform(0.0, static_cast<double>(field.canvas.width));
  const double y0 = spawn.Uniform(0.0, static_cast<double>(field.canvas.height));
  const double speed = o.max_speed * field.scale;
  const double vx = spawn.Uniform(-speed, speed);
  const double vy = spawn.Uniform(-speed, speed);
  out->color = Rgb{static_cast<uint8_t>(spawn.UniformInt(200, 255)), static_cast<uint8_t>(spawn.UniformInt(100, 255)),
                   static_cast<uint8_t>(spawn.UniformInt(0, 255))};

  out->x = x0 + vx * age;
  out->y = y0 + vy * age + 0.5 * o.gravity * field.scale * age * age;
  const double remaining = lifetime - age;
  out->radius = std::min(o.max_radius, static_cast<int>(o.radius_per_second * field.scale * remaining));
  out->alpha = std::min(1.0, remaining) * brightness;
  return out->radius > 0;
}

bool SampleDriftParticle(const ParticleField& field, int index, double local_t, double brightness,
                         ParticleSample* out) {
  PCG32 rng(LayerSeed(field.seed, "particles.drift", static_cast<uint64_t>(index)));
  const double width = static_cast<double>(field.canvas.width);
  const double height = static_cast<double>(field.canvas.height);
  const double x0 = rng.Uniform(0.0, width);
  const double y0 = rng.Uniform(0.0, height);
  const double vx = rng.Uniform(-2.0, 2.0) * field.scale;
  const double vy = rng.Uniform(-2.0, 2.0) * field.scale;
  const int size = rng.UniformInt(2, 6);
  const double twinkle = rng.Uniform(0.0, 2.0 * kPi);
  const double hue = rng.NextUnit();

  out->x = PositiveModulo(x0 + vx * local_t * kDriftPixelsPerUnit, width);
  out->y = PositiveModulo(y0 + vy * local_t * kDriftPixelsPerUnit, height);
  out->radius = std::min(field.options.max_radius, std::max(1, static_cast<int>(std::lround(size * field.scale))));
  out->alpha = (0.5 + 0.5 * std::sin(local_t * 3.0 + twinkle)) * brightness;
  out->color = LerpRgb(Rgb{120, 200, 255}, Rgb{255, 140, 220}, hue);
  return true;
}

}  // namespace

Layer MakeParticleLayer(const CanvasSize& canvas, const TimeWindow& window, const ParticleOptions& options,
                        uint64_t seed, std::vector<double> loudness_envelope, double track_duration) {
  auto field = std::make_shared<ParticleField>();
  field->canvas = canvas;
  field->options = options;
  field->seed = seed;
  field->start_seconds = window.start_seconds;
  field->track_duration = track_duration;
  field->scale = canvas.ScaleX();
  field->options.max_radius = std::max(1, options.max_radius);
  field->envelope = std::move(loudness_envelope);
  field->stamps = BuildDiscStamps(field->options.max_radius);

  Layer layer;
  layer.name = options.mode == ParticleMode::kBurst ? "overlay.particles.burst" : "overlay.particles.drift";
  layer.kind = LayerKind::kOverlay;
  layer.z_index = 20;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  layer.opacity = options.mode == ParticleMode::kBurst ? 0.9 : 0.7;
  layer.region = canvas.Full();

  std::shared_ptr<const ParticleField> shared = field;
  layer.render = [shared](double t, Image* out) {
    out->Clear();
    const ParticleField& f = *shared;
    const double local_t = t - f.start_seconds;
    const double loudness = EnvelopeAt(f.envelope, t, f.track_duration);
    const double brightness = 0.6 + 0.4 * loudness;
    for (int i = 0; i < f.options.count; ++i) {
      ParticleSample p;
      const bool visible = f.options.mode == ParticleMode::kBurst ? SampleBurstParticle(f, i, local_t, brightness, &p)
                                                                  : SampleDriftParticle(f, i, local_t, brightness, &p);
      if (!visible || p.alpha <= 0.0) {
        continue;
      }
      const DiscStamp& stamp = f.stamps[static_cast<size_t>(p.radius)];
      const int left = static_cast<int>(std::lround(p.x)) - stamp.radius;
      const int top = static_cast<int>(std::lround(p.y)) - stamp.radius;
      for (int sy = 0; sy < stamp.size; ++sy) {
        for (int sx = 0; sx < stamp.size; ++sx) {
          const float c = stamp.coverage[static_cast<size_t>(sy) * static_cast<size_t>(stamp.size) + static_cast<size_t>(sx)];
          if (c <= 0.0F) {
            continue;
          }
          DrawOver(out, left + sx, top + sy, p.color, p.alpha * static_cast<double>(c));
        }
      }
    }
  };
  return layer;
}

}  // namespace strata::core
