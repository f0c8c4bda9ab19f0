#include "strata/text/text_layout.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace strata::text {
namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

bool IsSpace(char32_t c) { return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' || c == U'\v'; }

std::u32string_view Trim(std::u32string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && IsSpace(text[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

}  // namespace

std::u32string DecodeUtf8(std::string_view text) {
  std::u32string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    size_t extra = 0;
    char32_t cp = 0;
    if (lead < 0x80U) {
      cp = lead;
    } else if ((lead & 0xE0U) == 0xC0U) {
      cp = lead & 0x1FU;
      extra = 1;
    } else if ((lead & 0xF0U) == 0xE0U) {
      cp = lead & 0x0FU;
      extra = 2;
    } else if ((lead & 0xF8U) == 0xF0U) {
      cp = lead & 0x07U;
      extra = 3;
    } else {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }
    if (i + extra >= text.size()) {
      out.push_back(kReplacementChar);
      break;
    }
    bool valid = true;
    for (size_t k = 1; k <= extra; ++k) {
      const auto next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0U) != 0x80U) {
        valid = false;
        break;
      }
      cp = (cp << 6U) | (next & 0x3FU);
    }
    if (!valid) {
      out.push_back(kReplacementChar);
      ++i;
      continue;
    }
    out.push_back(cp);
    i += extra + 1;
  }
  return out;
}

std::string EncodeUtf8(std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char32_t cp : text) {
    if (cp < 0x80U) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else if (cp < 0x10000U) {
      out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }
  }
  return out;
}

std::string SanitizeText(std::string_view text, size_t max_chars) {
  std::u32string decoded = DecodeUtf8(text);
  std::replace(decoded.begin(), decoded.end(), U'\n', U' ');
  std::replace(decoded.begin(), decoded.end(), U'\r', U' ');
  std::u32string trimmed(Trim(decoded));
  if (trimmed.size() > max_chars) {
    const size_t keep = max_chars > 3U ? max_chars - 3U : 0U;
    trimmed = trimmed.substr(0, keep) + U"...";
    if (trimmed.size() > max_chars) {
      trimmed.resize(max_chars);
    }
  }
  return EncodeUtf8(trimmed);
}

float MeasureLine(const GlyphSet& glyphs, std::u32string_view line) {
  float width = 0.0F;
  for (const char32_t cp : line) {
    const Glyph* glyph = glyphs.Find(static_cast<uint32_t>(cp));
    if (glyph != nullptr) {
      width += glyph->advance;
    }
  }
  return width;
}

std::vector<std::u32string> WrapWords(const GlyphSet& glyphs, std::u32string_view text, float max_width) {
  std::vector<std::u32string> lines;
  std::u32string current;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && IsSpace(text[i])) {
      ++i;
    }
    const size_t start = i;
    while (i < text.size() && !IsSpace(text[i])) {
      ++i;
    }
    if (i == start) {
      break;
    }
    const std::u32string_view word = text.substr(start, i - start);
    if (current.empty()) {
      current.assign(word);
      continue;
    }
    std::u32string candidate = current + U" ";
    candidate.append(word);
    if (MeasureLine(glyphs, candidate) <= max_width) {
      current = std::move(candidate);
    } else {
      lines.push_back(std::move(current));
      current.assign(word);
    }
  }
  if (!current.empty()) {
    lines.push_back(std::move(current));
  }
  return lines;
}

std::vector<std::string> SplitCaptionChunks(std::string_view text) {
  std::vector<std::string> chunks;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('.', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    const std::u32string piece(Trim(DecodeUtf8(text.substr(start, end - start))));
    if (piece.size() > 3U) {
      chunks.push_back(EncodeUtf8(piece));
    }
    start = end + 1;
  }
  if (chunks.empty()) {
    const std::u32string whole(Trim(DecodeUtf8(text)));
    if (!whole.empty()) {
      chunks.push_back(EncodeUtf8(whole));
    }
  }
  return chunks;
}

std::string FormatHashtags(const std::vector<std::string>& hashtags, size_t max_tags) {
  std::string out;
  size_t used = 0;
  for (const auto& raw : hashtags) {
    if (used >= max_tags) {
      break;
    }
    size_t begin = raw.find_first_not_of("# \t\r\n");
    if (begin == std::string::npos) {
      continue;
    }
    const size_t end = raw.find_last_not_of(" \t\r\n");
    if (!out.empty()) {
      out += "  ";
    }
    out += "#";
    out += raw.substr(begin, end - begin + 1);
    ++used;
  }
  return out;
}

size_t TypewriterRevealCount(size_t length, double local_seconds, double window_seconds) {
  if (length == 0U || !(window_seconds > 0.0)) {
    return 0U;
  }
  const double progress = std::max(0.0, std::min(1.0, local_seconds / window_seconds));
  const auto count = static_cast<size_t>(std::floor(static_cast<double>(length) * progress));
  return std::min(count, length);
}

}  // namespace strata::text
