#pragma once

#include <cstdint>

#include "strata/text/font.hpp"

namespace strata::core {

// State shared by the layer synthesizers of one job. Owned by the caller; the font cache is only
// written while layers are assembled.
struct RenderContext {
  uint64_t seed = 0;
  text::FontCache* fonts = nullptr;
};

}  // namespace strata::core
