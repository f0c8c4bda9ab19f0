#include "strata/core/image.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace strata::core {
namespace {

constexpr uint32_t kFullWeight = 255U * 255U;

}  // namespace

void ClearFrame(int width, int height, Frame* frame) {
  frame->width = width;
  frame->height = height;
  frame->rgb.assign(static_cast<size_t>(std::max(0, width)) * static_cast<size_t>(std::max(0, height)) * 3U, 0U);
}

void BlendImageOnto(const Image& layer, const Rect& region, double opacity, Frame* frame) {
  if (frame == nullptr || layer.width != region.width || layer.height != region.height) {
    return;
  }
  const uint32_t opacity_byte = static_cast<uint32_t>(std::lround(std::max(0.0, std::min(opacity, 1.0)) * 255.0));
  if (opacity_byte == 0U) {
    return;
  }
  const Rect visible = IntersectRect(region, Rect{0, 0, frame->width, frame->height});
  if (visible.Empty()) {
    return;
  }

  for (int y = visible.y; y < visible.y + visible.height; ++y) {
    const uint8_t* src = layer.Pixel(visible.x - region.x, y - region.y);
    uint8_t* dst = frame->rgb.data() + (static_cast<size_t>(y) * static_cast<size_t>(frame->width) +
                                        static_cast<size_t>(visible.x)) * 3U;
    for (int x = 0; x < visible.width; ++x, src += 4, dst += 3) {
      const uint32_t weight = opacity_byte * static_cast<uint32_t>(src[3]);
      if (weight == 0U) {
        continue;
      }
      if (weight == kFullWeight) {
        dst[0] = src[0];
        dst[1] = src[1];
        dst[2] = src[2];
        continue;
      }
      const uint32_t keep = kFullWeight - weight;
      for (int c = 0; c < 3; ++c) {
        const uint32_t mixed = static_cast<uint32_t>(dst[c]) * keep + static_cast<uint32_t>(src[c]) * weight;
        dst[c] = static_cast<uint8_t>((mixed + kFullWeight / 2U) / kFullWeight);
      }
    }
  }
}

}  // namespace strata::core
