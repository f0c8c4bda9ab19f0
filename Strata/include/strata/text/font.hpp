#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata::text {

struct Glyph {
  int width = 0;
  int height = 0;
  int x_offset = 0;
  int y_offset = 0;
  float advance = 0.0F;
  std::vector<uint8_t> coverage;
};

// Pre-rasterized glyphs for one pixel height. Immutable once built, so it can be shared by
// render workers.
struct GlyphSet {
  float pixel_height = 0.0F;
  float ascent = 0.0F;
  float descent = 0.0F;
  float line_gap = 0.0F;
  std::unordered_map<uint32_t, Glyph> glyphs;

  float LineHeight() const { return ascent - descent; }
  bool Covers(uint32_t codepoint) const { return glyphs.count(codepoint) > 0; }
  const Glyph* Find(uint32_t codepoint) const;
};

class FontFace {
 public:
  bool LoadFromFile(const std::filesystem::path& path, std::string* error);
  bool LoadFromMemory(std::vector<uint8_t> data, std::string* error);

  bool valid() const { return !data_.empty(); }
  const std::filesystem::path& path() const { return path_; }

  // Rasterizes printable ASCII, Latin-1 and every code point of `extra` the font covers.
  bool BuildGlyphSet(float pixel_height, std::u32string_view extra, GlyphSet* out, std::string* error) const;

 private:
  std::filesystem::path path_;
  std::vector<uint8_t> data_;
};

// Glyph sets keyed by pixel height. Get() mutates the cache and must only be called while layers
// are being assembled; the returned sets are read-only afterwards. A request for code points the
// cached set has not seen yet rebuilds it with the union; sets handed out earlier stay valid.
class FontCache {
 public:
  FontCache() = default;
  explicit FontCache(std::shared_ptr<const FontFace> face) : face_(std::move(face)) {}

  bool HasFont() const { return (face_ != nullptr && face_->valid()) || !sets_.empty(); }
  std::shared_ptr<const GlyphSet> Get(float pixel_height, std::u32string_view text, std::string* error);

  // Serves a set built elsewhere, such as a bitmap font, for its pixel height. Without a face the
  // adopted set is returned as is.
  void Adopt(std::shared_ptr<const GlyphSet> set);

 private:
  struct Entry {
    std::shared_ptr<const GlyphSet> set;
    std::u32string requested;
  };

  std::shared_ptr<const FontFace> face_;
  std::map<int, Entry> sets_;
};

}  // namespace strata::text
