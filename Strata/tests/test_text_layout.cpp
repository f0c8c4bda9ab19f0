/**
 * @file test_text_layout.cpp
 * @brief Unit tests for text sanitizing, wrapping and rasterization
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <strata/core/image.hpp>
#include <strata/text/font.hpp>
#include <strata/text/text_layout.hpp>
#include <strata/text/text_raster.hpp>

using namespace strata::text;
using Catch::Matchers::WithinAbs;

namespace {

// Printable ASCII on a 10 px advance. Everything but the space is a solid 6x12 block sitting on
// the baseline, 2 px into its cell.
GlyphSet MonospaceGlyphs() {
  GlyphSet set;
  set.pixel_height = 20.0F;
  set.ascent = 16.0F;
  set.descent = -4.0F;
  for (uint32_t cp = 32; cp < 127; ++cp) {
    Glyph glyph;
    glyph.advance = 10.0F;
    if (cp != ' ') {
      glyph.width = 6;
      glyph.height = 12;
      glyph.x_offset = 2;
      glyph.y_offset = -12;
      glyph.coverage.assign(72U, 255U);
    }
    set.glyphs.emplace(cp, glyph);
  }
  return set;
}

struct InkBounds {
  int min_x = 0;
  int max_x = -1;
  int min_y = 0;
  int max_y = -1;
  size_t count = 0;
};

// Bounds of the pixels at or above `min_alpha`.
InkBounds FindInk(const strata::core::Image& image, uint8_t min_alpha) {
  InkBounds bounds;
  bounds.min_x = image.width;
  bounds.min_y = image.height;
  for (int y = 0; y < image.height; ++y) {
    for (int x = 0; x < image.width; ++x) {
      if (image.Pixel(x, y)[3] >= min_alpha) {
        ++bounds.count;
        bounds.min_x = std::min(bounds.min_x, x);
        bounds.max_x = std::max(bounds.max_x, x);
        bounds.min_y = std::min(bounds.min_y, y);
        bounds.max_y = std::max(bounds.max_y, y);
      }
    }
  }
  return bounds;
}

std::optional<std::filesystem::path> FindSystemFont() {
  const char* candidates[] = {
      "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
      "/usr/share/fonts/TTF/DejaVuSans.ttf",
      "/usr/share/fonts/dejavu/DejaVuSans.ttf",
      "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
  };
  for (const char* candidate : candidates) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return std::filesystem::path(candidate);
    }
  }
  return std::nullopt;
}

}  // namespace

TEST_CASE("SanitizeText flattens and truncates", "[text]") {
  SECTION("newlines become spaces and ends are trimmed") {
    REQUIRE(SanitizeText("  line one\nline two\r\n ", 220) == "line one line two");
  }

  SECTION("short text is untouched") {
    REQUIRE(SanitizeText("Hello", 5) == "Hello");
  }

  SECTION("long text ends with an ellipsis within the limit") {
    const std::string out = SanitizeText(std::string(300, 'a'), 160);
    REQUIRE(out.size() == 160U);
    REQUIRE(out.substr(157) == "...");
  }

  SECTION("limits count code points, not bytes") {
    const std::string accented = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";
    REQUIRE(SanitizeText(accented, 5) == accented);
    REQUIRE(SanitizeText(accented, 4) == "\xC3\xA9...");
  }

  SECTION("blank text sanitizes to empty") {
    REQUIRE(SanitizeText(" \n\t ", 50).empty());
  }
}

TEST_CASE("UTF-8 decoding replaces malformed input", "[text]") {
  REQUIRE(DecodeUtf8("A\xC3\xA9") == std::u32string{U'A', 0xE9});
  REQUIRE(DecodeUtf8("\xE2\x82\xAC") == std::u32string{0x20AC});
  REQUIRE(DecodeUtf8("\xFF" "b") == std::u32string{0xFFFD, U'b'});
  REQUIRE(DecodeUtf8("ok\xC3") == std::u32string{U'o', U'k', 0xFFFD});
  REQUIRE(EncodeUtf8(DecodeUtf8("caf\xC3\xA9 \xF0\x9F\x8E\xB5")) == "caf\xC3\xA9 \xF0\x9F\x8E\xB5");
}

TEST_CASE("Hashtags are normalized and capped", "[text]") {
  SECTION("leading hashes collapse to one") {
    REQUIRE(FormatHashtags({"music", "#beats", "##loop "}, kMaxHashtags) == "#music  #beats  #loop");
  }

  SECTION("only the first five survive") {
    const std::vector<std::string> tags = {"a", "b", "c", "d", "e", "f", "g"};
    REQUIRE(FormatHashtags(tags, kMaxHashtags) == "#a  #b  #c  #d  #e");
  }

  SECTION("empty tags are skipped") {
    REQUIRE(FormatHashtags({"#", "  ", "x"}, kMaxHashtags) == "#x");
    REQUIRE(FormatHashtags({}, kMaxHashtags).empty());
  }
}

TEST_CASE("Caption text splits into sentences", "[text][caption]") {
  SECTION("short fragments are dropped") {
    const auto chunks = SplitCaptionChunks("First line here. ok. Second one follows.");
    REQUIRE(chunks == std::vector<std::string>{"First line here", "Second one follows"});
  }

  SECTION("no qualifying sentence keeps the whole text") {
    REQUIRE(SplitCaptionChunks("a. b.") == std::vector<std::string>{"a. b."});
  }

  SECTION("empty transcription has no chunks") {
    REQUIRE(SplitCaptionChunks("   ").empty());
  }
}

TEST_CASE("Typewriter reveals characters linearly", "[text][typewriter]") {
  REQUIRE(TypewriterRevealCount(10, 0.0, 2.0) == 0U);
  REQUIRE(TypewriterRevealCount(10, 1.0, 2.0) == 5U);
  REQUIRE(TypewriterRevealCount(10, 1.99, 2.0) == 9U);
  REQUIRE(TypewriterRevealCount(10, 5.0, 2.0) == 10U);
  REQUIRE(TypewriterRevealCount(10, -1.0, 2.0) == 0U);
  REQUIRE(TypewriterRevealCount(0, 1.0, 2.0) == 0U);
  REQUIRE(TypewriterRevealCount(10, 1.0, 0.0) == 0U);
}

TEST_CASE("Word wrap is greedy", "[text][layout]") {
  const GlyphSet glyphs = MonospaceGlyphs();

  REQUIRE_THAT(MeasureLine(glyphs, U"abcd"), WithinAbs(40.0, 1e-6));

  SECTION("lines fill up to the width") {
    const auto lines = WrapWords(glyphs, U"aa bb cc dd", 50.0F);
    REQUIRE(lines == std::vector<std::u32string>{U"aa bb", U"cc dd"});
  }

  SECTION("an overlong word keeps its own line") {
    const auto lines = WrapWords(glyphs, U"a verylongword b", 50.0F);
    REQUIRE(lines == std::vector<std::u32string>{U"a", U"verylongword", U"b"});
  }

  SECTION("whitespace-only input has no lines") {
    REQUIRE(WrapWords(glyphs, U"   ", 50.0F).empty());
  }
}

TEST_CASE("Missing glyphs fall back to '?'", "[text][layout]") {
  const GlyphSet glyphs = MonospaceGlyphs();
  REQUIRE(glyphs.Find(0x4E2D) == glyphs.Find('?'));
  REQUIRE(GlyphSet{}.Find('a') == nullptr);
}

TEST_CASE("Text blocks draw a dark halo around centered glyphs", "[text][raster]") {
  const GlyphSet glyphs = MonospaceGlyphs();
  strata::core::Image image;
  image.Resize(200, 60);
  RasterizeTextBlock(glyphs, U"ab", TextStyle{}, &image);

  // The line is 20 px wide on a 200 px image, so the cells start at x = 90 and the ink covers
  // x 92..97 and 102..107. The block is 20 px tall on 60, so the baseline sits at y = 36.
  const InkBounds fill = FindInk(image, 255U);
  REQUIRE(fill.count == 2U * 72U);
  REQUIRE(fill.min_x == 92);
  REQUIRE(fill.max_x == 107);
  REQUIRE(fill.min_y == 24);
  REQUIRE(fill.max_y == 35);
  REQUIRE(fill.min_x + fill.max_x + 1 == image.width);
  REQUIRE(fill.min_y + fill.max_y + 1 == image.height);

  SECTION("filled pixels take the fill color") {
    const uint8_t* px = image.Pixel(94, 30);
    REQUIRE(px[0] == 255U);
    REQUIRE(px[1] == 255U);
    REQUIRE(px[2] == 255U);
    REQUIRE(px[3] == 255U);
  }

  SECTION("the stroke surrounds the ink at the stroke alpha") {
    for (const auto& point : std::vector<std::pair<int, int>>{{90, 30}, {91, 30}, {99, 30}, {109, 30}, {94, 22}, {94, 37}}) {
      const uint8_t* px = image.Pixel(point.first, point.second);
      INFO("x " << point.first << " y " << point.second);
      REQUIRE(px[3] == 220U);
      REQUIRE(px[0] == 0U);
      REQUIRE(px[1] == 0U);
      REQUIRE(px[2] == 0U);
    }
  }

  SECTION("pixels past the stroke width stay transparent") {
    REQUIRE(image.Pixel(89, 30)[3] == 0U);
    REQUIRE(image.Pixel(110, 30)[3] == 0U);
    REQUIRE(image.Pixel(94, 21)[3] == 0U);
    REQUIRE(image.Pixel(94, 38)[3] == 0U);
  }

  SECTION("no stroke leaves only the fill") {
    TextStyle style;
    style.stroke_width = 0;
    RasterizeTextBlock(glyphs, U"ab", style, &image);
    REQUIRE(FindInk(image, 1U).count == 2U * 72U);
  }
}

TEST_CASE("A longer typewriter prefix inks more pixels", "[text][typewriter][raster]") {
  const GlyphSet glyphs = MonospaceGlyphs();
  const std::u32string title = U"strata";
  strata::core::Image image;
  image.Resize(200, 60);

  size_t previous = 0;
  for (const double t : {0.5, 1.0, 1.5, 2.0}) {
    const size_t count = TypewriterRevealCount(title.size(), t, 2.0);
    RasterizeTextBlock(glyphs, std::u32string_view(title).substr(0, count), TextStyle{}, &image);
    const InkBounds ink = FindInk(image, 255U);
    INFO("t " << t);
    REQUIRE(ink.count == count * 72U);
    REQUIRE(ink.count > previous);
    previous = ink.count;
  }
}

TEST_CASE("Font loading reports bad input", "[text][font]") {
  FontFace face;
  std::string error;
  REQUIRE_FALSE(face.LoadFromFile("/nonexistent/strata-font.ttf", &error));
  REQUIRE_FALSE(error.empty());
  REQUIRE_FALSE(face.valid());

  error.clear();
  REQUIRE_FALSE(face.LoadFromMemory(std::vector<uint8_t>(64, 0x5A), &error));
  REQUIRE_FALSE(error.empty());

  FontCache empty_cache;
  REQUIRE_FALSE(empty_cache.HasFont());
}

TEST_CASE("Text block rasterizes with a system font", "[text][font]") {
  const auto font_path = FindSystemFont();
  if (!font_path.has_value()) {
    SKIP("no system TrueType font available");
  }
  auto face = std::make_shared<FontFace>();
  std::string error;
  REQUIRE(face->LoadFromFile(*font_path, &error));
  FontCache cache(face);
  REQUIRE(cache.HasFont());
  const auto glyphs = cache.Get(32.0F, U"Hello Strata", &error);
  REQUIRE(glyphs != nullptr);
  REQUIRE(cache.Get(32.0F, U"Strata", &error) == glyphs);

  strata::core::Image image;
  image.Resize(400, 120);
  RasterizeTextBlock(*glyphs, U"Hello Strata", TextStyle{}, &image);

  size_t opaque = 0;
  int min_x = image.width;
  int max_x = -1;
  for (int y = 0; y < image.height; ++y) {
    for (int x = 0; x < image.width; ++x) {
      if (image.Pixel(x, y)[3] > 0U) {
        ++opaque;
        min_x = std::min(min_x, x);
        max_x = std::max(max_x, x);
      }
    }
  }
  REQUIRE(opaque > 100U);
  // Horizontally centered within a few pixels.
  REQUIRE(std::abs((min_x + max_x) / 2 - image.width / 2) <= 6);

  SECTION("empty text leaves the image transparent") {
    RasterizeTextBlock(*glyphs, U"", TextStyle{}, &image);
    for (size_t i = 3; i < image.rgba.size(); i += 4) {
      REQUIRE(image.rgba[i] == 0U);
    }
  }
}

TEST_CASE("Glyph sets grow to cover the text they are asked for", "[text][font]") {
  const auto font_path = FindSystemFont();
  if (!font_path.has_value()) {
    SKIP("no system TrueType font available");
  }
  auto face = std::make_shared<FontFace>();
  std::string error;
  REQUIRE(face->LoadFromFile(*font_path, &error));
  FontCache cache(face);

  const auto latin = cache.Get(32.0F, U"Hello", &error);
  REQUIRE(latin != nullptr);
  REQUIRE_FALSE(latin->Covers(0x041F));

  const std::u32string cyrillic = U"\u041F\u0440\u0438\u0432\u0435\u0442";
  const auto grown = cache.Get(32.0F, cyrillic, &error);
  REQUIRE(grown != nullptr);
  REQUIRE(grown != latin);
  REQUIRE(grown->Covers(0x041F));
  REQUIRE(grown->Find(0x041F) != grown->Find('?'));
  REQUIRE(grown->Covers('H'));
  // Sets handed out earlier keep working.
  REQUIRE(latin->Find('H') != nullptr);

  REQUIRE(cache.Get(32.0F, U"\u041F", &error) == grown);

  strata::core::Image question;
  question.Resize(120, 60);
  RasterizeTextBlock(*grown, U"?", TextStyle{}, &question);
  strata::core::Image pe;
  pe.Resize(120, 60);
  RasterizeTextBlock(*grown, U"\u041F", TextStyle{}, &pe);
  REQUIRE(FindInk(pe, 255U).count > 0U);
  REQUIRE(pe.rgba != question.rgba);
}

TEST_CASE("Adopted glyph sets serve text without a font file", "[text][font]") {
  FontCache cache;
  REQUIRE_FALSE(cache.HasFont());
  cache.Adopt(std::make_shared<const GlyphSet>(MonospaceGlyphs()));
  REQUIRE(cache.HasFont());

  std::string error;
  const auto glyphs = cache.Get(20.0F, U"any text", &error);
  REQUIRE(glyphs != nullptr);
  REQUIRE(glyphs->Covers('a'));
  REQUIRE(cache.Get(20.0F, U"\u041F", &error) == glyphs);

  REQUIRE(cache.Get(48.0F, U"a", &error) == nullptr);
  REQUIRE_FALSE(error.empty());
}
