#include "strata/text/text_raster.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include "strata/text/text_layout.hpp"

namespace strata::text {
namespace {

void StampGlyph(const Glyph& glyph, int origin_x, int baseline_y, int width, int height, std::vector<uint8_t>* mask) {
  for (int gy = 0; gy < glyph.height; ++gy) {
    const int y = baseline_y + glyph.y_offset + gy;
    if (y < 0 || y >= height) {
      continue;
    }
    for (int gx = 0; gx < glyph.width; ++gx) {
      const int x = origin_x + glyph.x_offset + gx;
      if (x < 0 || x >= width) {
        continue;
      }
      const uint8_t value = glyph.coverage[static_cast<size_t>(gy) * static_cast<size_t>(glyph.width) +
                                           static_cast<size_t>(gx)];
      uint8_t& dst = (*mask)[static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)];
      dst = std::max(dst, value);
    }
  }
}

// Max of the mask shifted by (-w, 0, +w) in both axes, matching a stroked draw at those offsets.
std::vector<uint8_t> DilateMask(const std::vector<uint8_t>& mask, int width, int height, int stroke_width) {
  std::vector<uint8_t> horizontal(mask.size(), 0U);
  for (int y = 0; y < height; ++y) {
    const size_t row = static_cast<size_t>(y) * static_cast<size_t>(width);
    for (int x = 0; x < width; ++x) {
      uint8_t v = mask[row + static_cast<size_t>(x)];
      if (x - stroke_width >= 0) {
        v = std::max(v, mask[row + static_cast<size_t>(x - stroke_width)]);
      }
      if (x + stroke_width < width) {
        v = std::max(v, mask[row + static_cast<size_t>(x + stroke_width)]);
      }
      horizontal[row + static_cast<size_t>(x)] = v;
    }
  }
  std::vector<uint8_t> out(mask.size(), 0U);
  const size_t stride = static_cast<size_t>(width);
  for (int y = 0; y < height; ++y) {
    const size_t row = static_cast<size_t>(y) * stride;
    for (int x = 0; x < width; ++x) {
      uint8_t v = horizontal[row + static_cast<size_t>(x)];
      if (y - stroke_width >= 0) {
        v = std::max(v, horizontal[row - static_cast<size_t>(stroke_width) * stride + static_cast<size_t>(x)]);
      }
      if (y + stroke_width < height) {
        v = std::max(v, horizontal[row + static_cast<size_t>(stroke_width) * stride + static_cast<size_t>(x)]);
      }
      out[row + static_cast<size_t>(x)] = v;
    }
  }
  return out;
}

}  // namespace

void RasterizeTextBlock(const GlyphSet& glyphs, std::u32string_view text, const TextStyle& style, core::Image* out) {
  if (out == nullptr) {
    return;
  }
  out->Clear();
  if (text.empty() || out->width <= 0 || out->height <= 0) {
    return;
  }

  const float max_width = static_cast<float>(std::max(1, out->width - style.side_padding));
  const std::vector<std::u32string> lines = WrapWords(glyphs, text, max_width);
  if (lines.empty()) {
    return;
  }

  const int line_height = static_cast<int>(std::ceil(glyphs.LineHeight()));
  const int block_height = static_cast<int>(lines.size()) * line_height +
                           static_cast<int>(lines.size() - 1U) * style.line_spacing;
  int top = (out->height - block_height) / 2;
  const int ascent = static_cast<int>(std::lround(glyphs.ascent));

  std::vector<uint8_t> fill_mask(static_cast<size_t>(out->width) * static_cast<size_t>(out->height), 0U);
  for (const auto& line : lines) {
    const float line_width = MeasureLine(glyphs, line);
    float pen_x = (static_cast<float>(out->width) - line_width) * 0.5F;
    const int baseline = top + ascent;
    for (const char32_t cp : line) {
      const Glyph* glyph = glyphs.Find(static_cast<uint32_t>(cp));
      if (glyph == nullptr) {
        continue;
      }
      StampGlyph(*glyph, static_cast<int>(std::lround(pen_x)), baseline, out->width, out->height, &fill_mask);
      pen_x += glyph->advance;
    }
    top += line_height + style.line_spacing;
  }

  const std::vector<uint8_t> stroke_mask =
      style.stroke_width > 0 ? DilateMask(fill_mask, out->width, out->height, style.stroke_width) : fill_mask;

  for (size_t i = 0; i < fill_mask.size(); ++i) {
    const double fill_a = static_cast<double>(fill_mask[i]) / 255.0;
    const double stroke_a = static_cast<double>(stroke_mask[i]) / 255.0 * static_cast<double>(style.stroke_alpha) / 255.0;
    const double alpha = fill_a + stroke_a * (1.0 - fill_a);
    if (alpha <= 0.0) {
      continue;
    }
    const double stroke_w = stroke_a * (1.0 - fill_a);
    uint8_t* px = out->rgba.data() + i * 4U;
    px[0] = core::UnitToByte((fill_a * style.fill.r + stroke_w * style.stroke.r) / (alpha * 255.0));
    px[1] = core::UnitToByte((fill_a * style.fill.g + stroke_w * style.stroke.g) / (alpha * 255.0));
    px[2] = core::UnitToByte((fill_a * style.fill.b + stroke_w * style.stroke.b) / (alpha * 255.0));
    px[3] = core::UnitToByte(alpha);
  }
}

}  // namespace strata::text
