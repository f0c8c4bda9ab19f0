#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <memory>
#include <vector>

#include "strata/core/synthesizers.hpp"

namespace strata::core {
namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr size_t kLutSize = 1024;

double Clamp01(double value) { return std::max(0.0, std::min(value, 1.0)); }

double Normalized(int i, int count) {
  return count > 1 ? static_cast<double>(i) / static_cast<double>(count - 1) : 0.0;
}

// Column and row terms of sin(A(x) + B(y)) so a frame costs O(width + height) trig calls.
struct ClassicTables {
  int width = 0;
  int height = 0;
  std::vector<double> column_phase;
  std::vector<double> row_sin;
  std::vector<double> row_cos;
  std::array<Rgb, kLutSize> palette{};
};

std::shared_ptr<const ClassicTables> BuildClassicTables(const CanvasSize& canvas) {
  auto tables = std::make_shared<ClassicTables>();
  tables->width = canvas.width;
  tables->height = canvas.height;
  tables->column_phase.resize(static_cast<size_t>(canvas.width));
  for (int x = 0; x < canvas.width; ++x) {
    tables->column_phase[static_cast<size_t>(x)] = 2.0 * kPi * 1.5 * Normalized(x, canvas.width);
  }
  tables->row_sin.resize(static_cast<size_t>(canvas.height));
  tables->row_cos.resize(static_cast<size_t>(canvas.height));
  for (int y = 0; y < canvas.height; ++y) {
    const double b = 2.0 * kPi * 1.2 * Normalized(y, canvas.height);
    tables->row_sin[static_cast<size_t>(y)] = std::sin(b);
    tables->row_cos[static_cast<size_t>(y)] = std::cos(b);
  }
  for (size_t i = 0; i < kLutSize; ++i) {
    const double v = static_cast<double>(i) / static_cast<double>(kLutSize - 1);
    tables->palette[i] = Rgb{UnitToByte(Clamp01(0.6 * v + 0.25)), UnitToByte(Clamp01(0.25 * v + 0.05)),
                             UnitToByte(Clamp01(0.9 * v + 0.25))};
  }
  return tables;
}

struct EnergyTables {
  int width = 0;
  int height = 0;
  std::vector<double> column_x;
  std::vector<double> row_y;
  // sin(d / 50) * exp(-d / 200) and cos(d / 50) * exp(-d / 200) for the distance d to the center.
  std::vector<float> vortex_sin;
  std::vector<float> vortex_cos;
};

std::shared_ptr<const EnergyTables> BuildEnergyTables(const CanvasSize& canvas) {
  auto tables = std::make_shared<EnergyTables>();
  tables->width = canvas.width;
  tables->height = canvas.height;
  tables->column_x.resize(static_cast<size_t>(canvas.width));
  for (int x = 0; x < canvas.width; ++x) {
    tables->column_x[static_cast<size_t>(x)] = 8.0 * kPi * Normalized(x, canvas.width);
  }
  tables->row_y.resize(static_cast<size_t>(canvas.height));
  for (int y = 0; y < canvas.height; ++y) {
    tables->row_y[static_cast<size_t>(y)] = 12.0 * kPi * Normalized(y, canvas.height);
  }
  const size_t count = static_cast<size_t>(canvas.width) * static_cast<size_t>(canvas.height);
  tables->vortex_sin.resize(count);
  tables->vortex_cos.resize(count);
  const double cx = static_cast<double>(canvas.width) * 0.5;
  const double cy = static_cast<double>(canvas.height) * 0.5;
  for (int y = 0; y < canvas.height; ++y) {
    for (int x = 0; x < canvas.width; ++x) {
      const double d = std::hypot(static_cast<double>(x) - cx, static_cast<double>(y) - cy);
      const double falloff = std::exp(-d / 200.0);
      const size_t idx = static_cast<size_t>(y) * static_cast<size_t>(canvas.width) + static_cast<size_t>(x);
      tables->vortex_sin[idx] = static_cast<float>(std::sin(d / 50.0) * falloff);
      tables->vortex_cos[idx] = static_cast<float>(std::cos(d / 50.0) * falloff);
    }
  }
  return tables;
}

constexpr double kEnergyRange = 2.5;

std::array<Rgb, kLutSize> BuildEnergyPalette(double t) {
  std::array<Rgb, kLutSize> lut{};
  for (size_t i = 0; i < kLutSize; ++i) {
    const double energy = -kEnergyRange + 2.0 * kEnergyRange * static_cast<double>(i) / static_cast<double>(kLutSize - 1);
    const double phase = energy * kPi + t;
    lut[i] = Rgb{UnitToByte(0.5 + 0.5 * std::sin(phase)), UnitToByte(0.5 + 0.5 * std::sin(phase + 2.0 * kPi / 3.0)),
                 UnitToByte(0.5 + 0.5 * std::sin(phase + 4.0 * kPi / 3.0))};
  }
  return lut;
}

const std::array<Rgb, 5>& GradientPalette() {
  static const std::array<Rgb, 5> palette = {
      Rgb{255, 94, 98}, Rgb{255, 153, 102}, Rgb{72, 198, 239}, Rgb{111, 134, 214}, Rgb{161, 140, 209},
  };
  return palette;
}

Rgb SampleCyclicPalette(double u) {
  const auto& palette = GradientPalette();
  const double wrapped = u - std::floor(u);
  const double position = wrapped * static_cast<double>(palette.size());
  const size_t lo = static_cast<size_t>(position) % palette.size();
  const size_t hi = (lo + 1U) % palette.size();
  return LerpRgb(palette[lo], palette[hi], position - std::floor(position));
}

}  // namespace

Layer MakeClassicBackground(const CanvasSize& canvas, const TimeWindow& window, double track_duration) {
  Layer layer;
  layer.name = "background.classic";
  layer.kind = LayerKind::kBackground;
  layer.z_index = 0;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  layer.region = canvas.Full();

  const std::shared_ptr<const ClassicTables> tables = BuildClassicTables(canvas);
  const double period = track_duration > 0.0 ? track_duration : 1.0;
  layer.render = [tables, period](double t, Image* out) {
    const double phase = 2.0 * kPi * t / period;
    std::vector<double> column_sin(static_cast<size_t>(tables->width));
    std::vector<double> column_cos(static_cast<size_t>(tables->width));
    for (int x = 0; x < tables->width; ++x) {
      const double a = tables->column_phase[static_cast<size_t>(x)] + phase;
      column_sin[static_cast<size_t>(x)] = std::sin(a);
      column_cos[static_cast<size_t>(x)] = std::cos(a);
    }
    const double lut_scale = 0.5 * static_cast<double>(kLutSize - 1);
    for (int y = 0; y < tables->height; ++y) {
      const double sb = tables->row_sin[static_cast<size_t>(y)];
      const double cb = tables->row_cos[static_cast<size_t>(y)];
      uint8_t* px = out->Pixel(0, y);
      for (int x = 0; x < tables->width; ++x, px += 4) {
        const double s = column_sin[static_cast<size_t>(x)] * cb + column_cos[static_cast<size_t>(x)] * sb;
        const long idx = std::lround((s + 1.0) * lut_scale);
        const Rgb& c = tables->palette[static_cast<size_t>(std::max(0L, std::min(idx, static_cast<long>(kLutSize - 1))))];
        px[0] = c.r;
        px[1] = c.g;
        px[2] = c.b;
        px[3] = 255U;
      }
    }
  };
  return layer;
}

Layer MakeEnergyBackground(const CanvasSize& canvas, const TimeWindow& window) {
  Layer layer;
  layer.name = "background.energy";
  layer.kind = LayerKind::kBackground;
  layer.z_index = 0;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  layer.region = canvas.Full();

  const std::shared_ptr<const EnergyTables> tables = BuildEnergyTables(canvas);
  layer.render = [tables](double t, Image* out) {
    const size_t w = static_cast<size_t>(tables->width);
    const size_t h = static_cast<size_t>(tables->height);
    std::vector<double> col_a(w);
    std::vector<double> col_b(w);
    for (size_t x = 0; x < w; ++x) {
      col_a[x] = std::sin(tables->column_x[x] + 3.0 * t);
      col_b[x] = 0.5 * std::cos(3.0 * tables->column_x[x] + 4.0 * t);
    }
    std::vector<double> row_a(h);
    std::vector<double> row_b(h);
    for (size_t y = 0; y < h; ++y) {
      row_a[y] = std::cos(tables->row_y[y] + 2.5 * t);
      row_b[y] = std::sin(2.0 * tables->row_y[y] + 3.0 * t);
    }
    const float spin_cos = static_cast<float>(std::cos(6.0 * t));
    const float spin_sin = static_cast<float>(std::sin(6.0 * t));
    const std::array<Rgb, kLutSize> palette = BuildEnergyPalette(t);
    const double lut_scale = static_cast<double>(kLutSize - 1) / (2.0 * kEnergyRange);

    for (size_t y = 0; y < h; ++y) {
      uint8_t* px = out->Pixel(0, static_cast<int>(y));
      const size_t row = y * w;
      for (size_t x = 0; x < w; ++x, px += 4) {
        const double vortex = static_cast<double>(tables->vortex_sin[row + x] * spin_cos +
                                                  tables->vortex_cos[row + x] * spin_sin);
        const double energy = col_a[x] * row_a[y] + col_b[x] * row_b[y] + vortex;
        const long idx = std::lround((energy + kEnergyRange) * lut_scale);
        const Rgb& c = palette[static_cast<size_t>(std::max(0L, std::min(idx, static_cast<long>(kLutSize - 1))))];
        px[0] = c.r;
        px[1] = c.g;
        px[2] = c.b;
        px[3] = 255U;
      }
    }
  };
  return layer;
}

Layer MakeGradientBackground(const CanvasSize& canvas, const TimeWindow& window, double track_duration) {
  Layer layer;
  layer.name = "background.gradient";
  layer.kind = LayerKind::kBackground;
  layer.z_index = 0;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = window.duration_seconds;
  layer.region = canvas.Full();

  const double period = track_duration > 0.0 ? track_duration : 1.0;
  const int width = canvas.width;
  const int height = canvas.height;
  layer.render = [period, width, height](double t, Image* out) {
    const double progress = t / period;
    const Rgb top = SampleCyclicPalette(progress);
    const Rgb bottom = SampleCyclicPalette(progress + 0.2);
    for (int y = 0; y < height; ++y) {
      const Rgb c = LerpRgb(top, bottom, Normalized(y, height));
      FillRect(out, Rect{0, y, width, 1}, c, 255U);
    }
  };
  return layer;
}

}  // namespace strata::core
