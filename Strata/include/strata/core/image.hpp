#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace strata::core {

struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
};

struct Rect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool Empty() const { return width <= 0 || height <= 0; }
};

inline Rect IntersectRect(const Rect& a, const Rect& b) {
  const int x0 = std::max(a.x, b.x);
  const int y0 = std::max(a.y, b.y);
  const int x1 = std::min(a.x + a.width, b.x + b.width);
  const int y1 = std::min(a.y + a.height, b.y + b.height);
  if (x1 <= x0 || y1 <= y0) {
    return Rect{x0, y0, 0, 0};
  }
  return Rect{x0, y0, x1 - x0, y1 - y0};
}

inline uint8_t UnitToByte(double unit) {
  const double clamped = std::max(0.0, std::min(unit, 1.0));
  return static_cast<uint8_t>(std::lround(clamped * 255.0));
}

inline Rgb LerpRgb(const Rgb& a, const Rgb& b, double t) {
  const double tt = std::max(0.0, std::min(t, 1.0));
  Rgb out;
  out.r = static_cast<uint8_t>(std::lround((1.0 - tt) * static_cast<double>(a.r) + tt * static_cast<double>(b.r)));
  out.g = static_cast<uint8_t>(std::lround((1.0 - tt) * static_cast<double>(a.g) + tt * static_cast<double>(b.g)));
  out.b = static_cast<uint8_t>(std::lround((1.0 - tt) * static_cast<double>(a.b) + tt * static_cast<double>(b.b)));
  return out;
}

// Straight-alpha RGBA buffer a layer renders into. Sized to the layer region, not the canvas.
struct Image {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgba;

  void Resize(int w, int h) {
    width = std::max(0, w);
    height = std::max(0, h);
    rgba.assign(static_cast<size_t>(width) * static_cast<size_t>(height) * 4U, 0U);
  }

  void Clear() { std::fill(rgba.begin(), rgba.end(), static_cast<uint8_t>(0U)); }

  void Fill(const Rgb& color, uint8_t alpha) {
    for (size_t i = 0; i + 3 < rgba.size(); i += 4) {
      rgba[i] = color.r;
      rgba[i + 1] = color.g;
      rgba[i + 2] = color.b;
      rgba[i + 3] = alpha;
    }
  }

  uint8_t* Pixel(int x, int y) {
    return rgba.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4U;
  }

  const uint8_t* Pixel(int x, int y) const {
    return rgba.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4U;
  }
};

// Straight-alpha "over" of a solid color onto one image pixel.
inline void DrawOver(Image* image, int x, int y, const Rgb& color, double alpha) {
  if (x < 0 || y < 0 || x >= image->width || y >= image->height || !(alpha > 0.0)) {
    return;
  }
  const double a = std::min(alpha, 1.0);
  uint8_t* px = image->Pixel(x, y);
  const double dst_a = static_cast<double>(px[3]) / 255.0;
  const double out_a = a + dst_a * (1.0 - a);
  const double dst_w = dst_a * (1.0 - a);
  px[0] = UnitToByte((static_cast<double>(color.r) * a + static_cast<double>(px[0]) * dst_w) / (out_a * 255.0));
  px[1] = UnitToByte((static_cast<double>(color.g) * a + static_cast<double>(px[1]) * dst_w) / (out_a * 255.0));
  px[2] = UnitToByte((static_cast<double>(color.b) * a + static_cast<double>(px[2]) * dst_w) / (out_a * 255.0));
  px[3] = UnitToByte(out_a);
}

inline void FillRect(Image* image, const Rect& rect, const Rgb& color, uint8_t alpha) {
  const Rect clipped = IntersectRect(rect, Rect{0, 0, image->width, image->height});
  for (int y = clipped.y; y < clipped.y + clipped.height; ++y) {
    uint8_t* px = image->Pixel(clipped.x, y);
    for (int x = 0; x < clipped.width; ++x, px += 4) {
      px[0] = color.r;
      px[1] = color.g;
      px[2] = color.b;
      px[3] = alpha;
    }
  }
}

struct Frame {
  int64_t index = 0;
  double timestamp_seconds = 0.0;
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgb;
};

// Resets the frame to an opaque black canvas of the given size.
void ClearFrame(int width, int height, Frame* frame);

// canvas = canvas * (1 - a) + layer * a with a = opacity * alpha / 255, clipped to the frame.
void BlendImageOnto(const Image& layer, const Rect& region, double opacity, Frame* frame);

}  // namespace strata::core
