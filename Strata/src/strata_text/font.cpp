#include "strata/text/font.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace strata::text {
namespace {

constexpr uint32_t kFallbackCodepoint = '?';
// Pixel heights are cached in quarter-pixel steps.
constexpr float kSizeSteps = 4.0F;

int SizeKey(float pixel_height) { return static_cast<int>(std::lround(pixel_height * kSizeSteps)); }

void SetError(std::string* error, const std::string& message) {
  if (error != nullptr) {
    *error = message;
  }
}

// Codepoints the font does not cover are left out so lookups fall back to '?'.
void AddGlyph(const stbtt_fontinfo& info, float scale, uint32_t codepoint, GlyphSet* set) {
  const int cp = static_cast<int>(codepoint);
  if (stbtt_FindGlyphIndex(&info, cp) == 0 && codepoint != ' ') {
    return;
  }
  int advance = 0;
  int left_bearing = 0;
  stbtt_GetCodepointHMetrics(&info, cp, &advance, &left_bearing);

  int x0 = 0;
  int y0 = 0;
  int x1 = 0;
  int y1 = 0;
  stbtt_GetCodepointBitmapBox(&info, cp, scale, scale, &x0, &y0, &x1, &y1);

  Glyph glyph;
  glyph.advance = static_cast<float>(advance) * scale;
  glyph.x_offset = x0;
  glyph.y_offset = y0;
  glyph.width = std::max(0, x1 - x0);
  glyph.height = std::max(0, y1 - y0);
  if (glyph.width > 0 && glyph.height > 0) {
    glyph.coverage.assign(static_cast<size_t>(glyph.width) * static_cast<size_t>(glyph.height), 0U);
    stbtt_MakeCodepointBitmap(&info, glyph.coverage.data(), glyph.width, glyph.height, glyph.width, scale, scale, cp);
  }
  set->glyphs.emplace(codepoint, std::move(glyph));
}

}  // namespace

const Glyph* GlyphSet::Find(uint32_t codepoint) const {
  auto it = glyphs.find(codepoint);
  if (it != glyphs.end()) {
    return &it->second;
  }
  it = glyphs.find(kFallbackCodepoint);
  return it != glyphs.end() ? &it->second : nullptr;
}

bool FontFace::LoadFromFile(const std::filesystem::path& path, std::string* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    SetError(error, "Failed to open font file: " + path.string());
    return false;
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (!LoadFromMemory(std::move(bytes), error)) {
    return false;
  }
  path_ = path;
  return true;
}

bool FontFace::LoadFromMemory(std::vector<uint8_t> data, std::string* error) {
  if (data.empty()) {
    SetError(error, "Font data is empty.");
    return false;
  }
  const int offset = stbtt_GetFontOffsetForIndex(data.data(), 0);
  stbtt_fontinfo info;
  if (offset < 0 || !stbtt_InitFont(&info, data.data(), offset)) {
    SetError(error, "Font data is not a usable TrueType font.");
    return false;
  }
  data_ = std::move(data);
  return true;
}

bool FontFace::BuildGlyphSet(float pixel_height, std::u32string_view extra, GlyphSet* out,
                              std::string* error) const {
  if (out == nullptr || !valid()) {
    SetError(error, "No font loaded.");
    return false;
  }
  if (!(pixel_height > 0.0F)) {
    SetError(error, "Font pixel height must be positive.");
    return false;
  }
  stbtt_fontinfo info;
  if (!stbtt_InitFont(&info, data_.data(), stbtt_GetFontOffsetForIndex(data_.data(), 0))) {
    SetError(error, "Font data is not a usable TrueType font.");
    return false;
  }

  const float scale = stbtt_ScaleForPixelHeight(&info, pixel_height);
  int ascent = 0;
  int descent = 0;
  int line_gap = 0;
  stbtt_GetFontVMetrics(&info, &ascent, &descent, &line_gap);

  GlyphSet set;
  set.pixel_height = pixel_height;
  set.ascent = static_cast<float>(ascent) * scale;
  set.descent = static_cast<float>(descent) * scale;
  set.line_gap = static_cast<float>(line_gap) * scale;
  for (uint32_t cp = 32; cp <= 126; ++cp) {
    AddGlyph(info, scale, cp, &set);
  }
  for (uint32_t cp = 160; cp <= 255; ++cp) {
    AddGlyph(info, scale, cp, &set);
  }
  for (const char32_t c : extra) {
    const auto cp = static_cast<uint32_t>(c);
    if (cp >= 32U && !set.Covers(cp)) {
      AddGlyph(info, scale, cp, &set);
    }
  }
  *out = std::move(set);
  return true;
}

std::shared_ptr<const GlyphSet> FontCache::Get(float pixel_height, std::u32string_view text, std::string* error) {
  const int key = SizeKey(pixel_height);
  if (face_ == nullptr || !face_->valid()) {
    const auto it = sets_.find(key);
    if (it == sets_.end()) {
      SetError(error, "No font configured.");
      return nullptr;
    }
    return it->second.set;
  }
  Entry& entry = sets_[key];
  std::u32string requested = entry.requested;
  requested.append(text.begin(), text.end());
  std::sort(requested.begin(), requested.end());
  requested.erase(std::unique(requested.begin(), requested.end()), requested.end());
  if (entry.set != nullptr && requested == entry.requested) {
    return entry.set;
  }

  auto set = std::make_shared<GlyphSet>();
  if (!face_->BuildGlyphSet(static_cast<float>(key) / kSizeSteps, requested, set.get(), error)) {
    return nullptr;
  }
  entry.set = set;
  entry.requested = std::move(requested);
  return set;
}

void FontCache::Adopt(std::shared_ptr<const GlyphSet> set) {
  if (set == nullptr) {
    return;
  }
  Entry& entry = sets_[SizeKey(set->pixel_height)];
  entry.requested.clear();
  for (const auto& glyph : set->glyphs) {
    entry.requested.push_back(static_cast<char32_t>(glyph.first));
  }
  std::sort(entry.requested.begin(), entry.requested.end());
  entry.set = std::move(set);
}

}  // namespace strata::text
