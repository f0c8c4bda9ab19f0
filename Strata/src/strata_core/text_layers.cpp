#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "strata/core/synthesizers.hpp"
#include "strata/text/text_layout.hpp"

namespace strata::core {
namespace {

constexpr double kPi = 3.14159265358979323846;

Layer BaseTextLayer(const TextLayerSpec& spec, const TimeWindow& window) {
  Layer layer;
  layer.name = spec.name;
  layer.kind = spec.kind;
  layer.z_index = spec.z_index;
  layer.start_seconds = window.start_seconds;
  layer.duration_seconds = std::max(0.0, window.duration_seconds);
  layer.region = spec.region;
  return layer;
}

Layer EmptyTextLayer(const TextLayerSpec& spec, const TimeWindow& window, bool text_missing,
                     std::vector<RenderWarning>* warnings) {
  if (text_missing) {
    AddWarning(warnings, WarningKind::kLayerInputMissing, spec.name + ": no text supplied, layer disabled");
  }
  Layer layer = BaseTextLayer(spec, window);
  layer.duration_seconds = 0.0;
  layer.render = [](double, Image* out) { out->Clear(); };
  return layer;
}

std::shared_ptr<const text::GlyphSet> ResolveGlyphs(const TextLayerSpec& spec, const std::string& content,
                                                    RenderContext* context, std::vector<RenderWarning>* warnings) {
  if (context == nullptr || context->fonts == nullptr || !context->fonts->HasFont()) {
    return nullptr;
  }
  std::string error;
  std::shared_ptr<const text::GlyphSet> glyphs = context->fonts->Get(spec.pixel_height, text::DecodeUtf8(content), &error);
  if (glyphs == nullptr) {
    AddWarning(warnings, WarningKind::kResourceMissing, spec.name + ": " + error);
  }
  return glyphs;
}

std::shared_ptr<const Image> RasterizeOnce(const TextLayerSpec& spec, const text::GlyphSet* glyphs,
                                           const std::string& content) {
  auto image = std::make_shared<Image>();
  image->Resize(spec.region.width, spec.region.height);
  if (glyphs != nullptr) {
    text::RasterizeTextBlock(*glyphs, text::DecodeUtf8(content), spec.style, image.get());
  }
  return image;
}

void CopyImage(const Image& src, Image* out) {
  if (out->rgba.size() == src.rgba.size()) {
    std::copy(src.rgba.begin(), src.rgba.end(), out->rgba.begin());
  } else {
    out->Clear();
  }
}

// Nearest-neighbour sample of `src` scaled by `scale` about the image center.
void ScaleAboutCenter(const Image& src, double scale, Image* out) {
  out->Clear();
  if (src.width != out->width || src.height != out->height || !(scale > 0.0)) {
    return;
  }
  const double cx = static_cast<double>(src.width) * 0.5;
  const double cy = static_cast<double>(src.height) * 0.5;
  for (int y = 0; y < out->height; ++y) {
    const int sy = static_cast<int>(std::floor(cy + (static_cast<double>(y) + 0.5 - cy) / scale));
    if (sy < 0 || sy >= src.height) {
      continue;
    }
    for (int x = 0; x < out->width; ++x) {
      const int sx = static_cast<int>(std::floor(cx + (static_cast<double>(x) + 0.5 - cx) / scale));
      if (sx < 0 || sx >= src.width) {
        continue;
      }
      std::copy_n(src.Pixel(sx, sy), 4, out->Pixel(x, y));
    }
  }
}

void ShiftImage(const Image& src, PixelOffset offset, Image* out) {
  out->Clear();
  if (src.width != out->width || src.height != out->height) {
    return;
  }
  const int x_begin = std::max(0, offset.dx);
  const int x_end = std::min(out->width, src.width + offset.dx);
  if (x_begin >= x_end) {
    return;
  }
  for (int y = std::max(0, offset.dy); y < std::min(out->height, src.height + offset.dy); ++y) {
    std::copy_n(src.Pixel(x_begin - offset.dx, y - offset.dy), static_cast<size_t>(x_end - x_begin) * 4U,
                out->Pixel(x_begin, y));
  }
}

}  // namespace

double PulseScale(double local_seconds) { return 1.0 + 0.3 * std::abs(std::sin(local_seconds * 4.0 * kPi)); }

double SlideProgress(double local_seconds, double window_seconds) {
  const double slide = std::min(kSlideInSeconds, std::max(0.0, window_seconds) * 0.5);
  if (!(slide > 0.0) || local_seconds >= slide) {
    return 1.0;
  }
  if (local_seconds <= 0.0) {
    return 0.0;
  }
  const double p = local_seconds / slide;
  return 1.0 - (1.0 - p) * (1.0 - p);
}

PixelOffset SlideOffset(SlideDirection direction, double local_seconds, double window_seconds, int width, int height) {
  const double remaining = 1.0 - SlideProgress(local_seconds, window_seconds);
  PixelOffset offset;
  switch (direction) {
    case SlideDirection::kFromLeft:
      offset.dx = -static_cast<int>(std::lround(remaining * static_cast<double>(width)));
      break;
    case SlideDirection::kFromRight:
      offset.dx = static_cast<int>(std::lround(remaining * static_cast<double>(width)));
      break;
    case SlideDirection::kFromBottom:
      offset.dy = static_cast<int>(std::lround(remaining * static_cast<double>(height)));
      break;
  }
  return offset;
}

size_t CaptionChunkIndex(size_t chunk_count, double local_seconds, double window_seconds) {
  if (chunk_count == 0U || !(window_seconds > 0.0) || local_seconds <= 0.0) {
    return 0U;
  }
  const double slice = window_seconds / static_cast<double>(chunk_count);
  const auto index = static_cast<size_t>(std::floor(local_seconds / slice));
  return std::min(index, chunk_count - 1U);
}

Layer MakeStaticTextLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                          RenderContext* context, std::vector<RenderWarning>* warnings) {
  const std::string content = text::SanitizeText(text, spec.max_chars);
  if (content.empty() || !(window.duration_seconds > 0.0)) {
    return EmptyTextLayer(spec, window, content.empty(), warnings);
  }
  const std::shared_ptr<const text::GlyphSet> glyphs = ResolveGlyphs(spec, content, context, warnings);
  const std::shared_ptr<const Image> image = RasterizeOnce(spec, glyphs.get(), content);

  Layer layer = BaseTextLayer(spec, window);
  layer.render = [image](double, Image* out) { CopyImage(*image, out); };
  return layer;
}

Layer MakeTypewriterLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                          RenderContext* context, std::vector<RenderWarning>* warnings) {
  const std::string content = text::SanitizeText(text, spec.max_chars);
  if (content.empty() || !(window.duration_seconds > 0.0)) {
    return EmptyTextLayer(spec, window, content.empty(), warnings);
  }
  const std::shared_ptr<const text::GlyphSet> glyphs = ResolveGlyphs(spec, content, context, warnings);
  auto characters = std::make_shared<const std::u32string>(text::DecodeUtf8(content));

  Layer layer = BaseTextLayer(spec, window);
  const text::TextStyle style = spec.style;
  const double start = window.start_seconds;
  const double duration = window.duration_seconds;
  layer.render = [glyphs, characters, style, start, duration](double t, Image* out) {
    if (glyphs == nullptr) {
      out->Clear();
      return;
    }
    const size_t count = text::TypewriterRevealCount(characters->size(), t - start, duration);
    text::RasterizeTextBlock(*glyphs, std::u32string_view(*characters).substr(0, count), style, out);
  };
  return layer;
}

Layer MakeCaptionLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                       RenderContext* context, std::vector<RenderWarning>* warnings) {
  const std::string content = text::SanitizeText(text, spec.max_chars);
  const std::vector<std::string> chunks = text::SplitCaptionChunks(content);
  if (chunks.empty() || !(window.duration_seconds > 0.0)) {
    return EmptyTextLayer(spec, window, chunks.empty(), warnings);
  }
  const std::shared_ptr<const text::GlyphSet> glyphs = ResolveGlyphs(spec, content, context, warnings);
  auto images = std::make_shared<std::vector<std::shared_ptr<const Image>>>();
  images->reserve(chunks.size());
  for (const auto& chunk : chunks) {
    images->push_back(RasterizeOnce(spec, glyphs.get(), chunk));
  }

  Layer layer = BaseTextLayer(spec, window);
  const double start = window.start_seconds;
  const double duration = window.duration_seconds;
  std::shared_ptr<const std::vector<std::shared_ptr<const Image>>> shared = images;
  layer.render = [shared, start, duration](double t, Image* out) {
    const size_t index = CaptionChunkIndex(shared->size(), t - start, duration);
    CopyImage(*(*shared)[index], out);
  };
  return layer;
}

Layer MakePulsingTextLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                           RenderContext* context, std::vector<RenderWarning>* warnings) {
  const std::string content = text::SanitizeText(text, spec.max_chars);
  if (content.empty() || !(window.duration_seconds > 0.0)) {
    return EmptyTextLayer(spec, window, content.empty(), warnings);
  }
  const std::shared_ptr<const text::GlyphSet> glyphs = ResolveGlyphs(spec, content, context, warnings);
  const std::shared_ptr<const Image> image = RasterizeOnce(spec, glyphs.get(), content);

  Layer layer = BaseTextLayer(spec, window);
  const double start = window.start_seconds;
  layer.render = [image, start](double t, Image* out) { ScaleAboutCenter(*image, PulseScale(t - start), out); };
  return layer;
}

Layer MakeSlidingTextLayer(const TextLayerSpec& spec, const TimeWindow& window, const std::string& text,
                           SlideDirection direction, RenderContext* context, std::vector<RenderWarning>* warnings) {
  const std::string content = text::SanitizeText(text, spec.max_chars);
  if (content.empty() || !(window.duration_seconds > 0.0)) {
    return EmptyTextLayer(spec, window, content.empty(), warnings);
  }
  const std::shared_ptr<const text::GlyphSet> glyphs = ResolveGlyphs(spec, content, context, warnings);
  const std::shared_ptr<const Image> image = RasterizeOnce(spec, glyphs.get(), content);

  Layer layer = BaseTextLayer(spec, window);
  const double start = window.start_seconds;
  const double duration = window.duration_seconds;
  layer.render = [image, direction, start, duration](double t, Image* out) {
    ShiftImage(*image, SlideOffset(direction, t - start, duration, image->width, image->height), out);
  };
  return layer;
}

}  // namespace strata::core
