#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "strata/text/font.hpp"

namespace strata::text {

constexpr size_t kDefaultTextLimit = 220;
constexpr size_t kTitleTextLimit = 160;
constexpr size_t kCaptionTextLimit = 400;
constexpr size_t kMaxHashtags = 5;

std::u32string DecodeUtf8(std::string_view text);
std::string EncodeUtf8(std::u32string_view text);

// Newlines become spaces, surrounding whitespace is trimmed, and text longer than max_chars code
// points is cut to max_chars - 3 followed by "...".
std::string SanitizeText(std::string_view text, size_t max_chars);

float MeasureLine(const GlyphSet& glyphs, std::u32string_view line);

// Greedy word wrap. A single word wider than max_width keeps a line of its own.
std::vector<std::u32string> WrapWords(const GlyphSet& glyphs, std::u32string_view text, float max_width);

// Sentences longer than three characters, split at '.'; the whole text when none qualify.
std::vector<std::string> SplitCaptionChunks(std::string_view text);

// First max_tags hashtags, each with exactly one leading '#', joined by two spaces.
std::string FormatHashtags(const std::vector<std::string>& hashtags, size_t max_tags);

size_t TypewriterRevealCount(size_t length, double local_seconds, double window_seconds);

}  // namespace strata::text
