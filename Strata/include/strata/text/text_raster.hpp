#pragma once

#include <cstdint>
#include <string_view>

#include "strata/core/image.hpp"
#include "strata/text/font.hpp"

namespace strata::text {

struct TextStyle {
  core::Rgb fill{255, 255, 255};
  core::Rgb stroke{0, 0, 0};
  uint8_t stroke_alpha = 220;
  int stroke_width = 2;
  int line_spacing = 8;
  int side_padding = 20;
};

// Clears `out` to transparent, then draws `text` word-wrapped to the image width minus the side
// padding, each line horizontally centered and the block vertically centered.
void RasterizeTextBlock(const GlyphSet& glyphs, std::u32string_view text, const TextStyle& style, core::Image* out);

}  // namespace strata::text
